#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <vector>

#include "internal/db/model/element_record.hpp"
#include "internal/db/model/iteration_record.hpp"
#include "internal/db/model/param_source.hpp"
#include "internal/db/model/run_record.hpp"

namespace jobflow::store {
class PersistentStore;
}

namespace jobflow::graph {

/*
  Precomputed dependency indices over runs, iterations and elements.

  Edges come from parameter provenance: a run depends on every run that
  produced a parameter in its data index. Repeats paths and self edges are
  skipped. Run edges are lifted to iterations through run.iteration_id and
  to elements through iteration.element_id.

  Built once per bulk operation and never updated; rebuild after the store
  has been mutated.
*/
class DependencyCache {
 public:
  using IdSet = std::set<uint64_t>;

  static DependencyCache Build(store::PersistentStore& store);

  // sources is indexed by parameter ID.
  static DependencyCache FromRecords(const std::vector<db::model::RunRecord>&       runs,
                                     const std::vector<db::model::IterationRecord>& iterations,
                                     const std::vector<db::model::ElementRecord>&   elements,
                                     const std::vector<db::model::ParamSource>&     sources);

  // All lookups throw util::NotFound for an ID outside the cache.
  const IdSet& RunDependencies(uint64_t run_id) const;
  const IdSet& RunDependents(uint64_t run_id) const;

  // Runs the iteration's runs depend on.
  const IdSet& IterationRunDependencies(uint64_t iteration_id) const;
  const IdSet& IterationDependencies(uint64_t iteration_id) const;

  // Iterations the element's iterations depend on.
  const IdSet& ElementIterationDependencies(uint64_t element_id) const;
  const IdSet& ElementDependencies(uint64_t element_id) const;
  const IdSet& ElementDependents(uint64_t element_id) const;
  const IdSet& ElementDependentsRecursive(uint64_t element_id) const;

  size_t NumRuns() const {
    return run_dependencies_.size();
  }
  size_t NumIterations() const {
    return iteration_dependencies_.size();
  }
  size_t NumElements() const {
    return element_dependencies_.size();
  }

 private:
  std::map<uint64_t, IdSet> run_dependencies_;
  std::map<uint64_t, IdSet> run_dependents_;
  std::map<uint64_t, IdSet> iteration_run_dependencies_;
  std::map<uint64_t, IdSet> iteration_dependencies_;
  std::map<uint64_t, IdSet> element_iteration_dependencies_;
  std::map<uint64_t, IdSet> element_dependencies_;
  std::map<uint64_t, IdSet> element_dependents_;
  std::map<uint64_t, IdSet> element_dependents_rec_;
};

} // namespace jobflow::graph
