#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "internal/db/model/submission_record.hpp"

namespace jobflow::scheduling {

// Jobscripts keyed by provisional index, before renumbering.
using JobscriptMap = std::map<uint64_t, db::model::JobscriptRecord>;

// jobscript index -> jobscript element -> run IDs it waits on outside itself
using ElementDependencies = std::map<uint64_t, std::map<uint64_t, std::vector<uint64_t>>>;

using JobscriptDependencies = std::map<uint64_t, std::map<uint64_t, db::model::JobscriptDependency>>;

/*
  Maps each jobscript element to the elements of earlier jobscripts that
  own the runs it depends on. A dependency is an array dependency when the
  mapping is one-to-one over all elements of both jobscripts.
*/
JobscriptDependencies ResolveJobscriptDependencies(const JobscriptMap& jobscripts, const ElementDependencies& element_deps);

/*
  Folds a jobscript into its only dependency when both share a resource
  hash and the dependency is an array dependency. Later jobscripts that
  pointed at the folded one are repointed at the survivor.
*/
JobscriptMap MergeJobscriptsAcrossTasks(JobscriptMap jobscripts);

// Dense renumbering; dependency keys follow.
std::vector<db::model::JobscriptRecord> JobscriptsToList(JobscriptMap jobscripts);

} // namespace jobflow::scheduling
