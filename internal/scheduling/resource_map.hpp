#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/iteration_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/store/persistent_store.hpp"

namespace jobflow::scheduling {

inline constexpr int64_t kNoRun = -1;

// [action][element] matrix; kNoRun marks an empty cell.
using CellMatrix = std::vector<std::vector<int64_t>>;

struct ResolvedResources {
  std::string              hash;
  google::protobuf::Struct document;
  bool                     use_job_array = false;
};

/*
  Resolves the resource requirements of one run. Supplied by the template
  layer. Runs share resources when both the returned hash and document
  match.
*/
class ResourceResolver {
 public:
  virtual ~ResourceResolver() = default;

  virtual ResolvedResources Resolve(const db::model::TaskRecord& task, const db::model::ElementRecord& element, const db::model::RunRecord& run) = 0;
};

/*
  Reads a run's "resources" metadata entry. A "use_job_array" boolean in
  that document marks array-capable resources.
*/
class MetadataResourceResolver : public ResourceResolver {
 public:
  ResolvedResources Resolve(const db::model::TaskRecord& task, const db::model::ElementRecord& element, const db::model::RunRecord& run) override;
};

// Key-sorted text form of a resources document. Equal documents, and only
// those, have equal canonical forms.
std::string CanonicalResources(const google::protobuf::Struct& document);

// FNV-1a 64 of the canonical form as 16 hex digits; the same on every build.
std::string HashResources(const google::protobuf::Struct& document);

struct RunResourceMap {
  std::vector<ResolvedResources> resources; // first-appearance order
  CellMatrix                     resource_idx;
  CellMatrix                     run_ids;

  size_t NumActions() const {
    return resource_idx.size();
  }
  size_t NumElements() const {
    return resource_idx.empty() ? 0 : resource_idx.front().size();
  }
};

/*
  Builds the resource and run-ID matrices for the pending runs of one task
  at one loop position. Rows are action indices, columns element indices.
  Iterations whose runs are not initialised, or whose loop index differs,
  are skipped.
*/
RunResourceMap GenerateRunResourceMap(const db::model::TaskRecord& task, const std::vector<store::ElementView>& elements,
                                      const db::model::LoopIndex& loop_idx, ResourceResolver& resolver);

} // namespace jobflow::scheduling
