#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "internal/db/model/loop_record.hpp"
#include "internal/db/model/submission_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/scheduling/resource_map.hpp"
#include "internal/store/persistent_store.hpp"

namespace jobflow::scheduling {

// (task ID, loop position) in execution order.
using TaskPathway = std::vector<std::pair<uint64_t, db::model::LoopIndex>>;

/*
  Expands the task list by loop iterations. Loops are placed parents first;
  each recorded iteration repeats the loop's task range with the loop's
  index added to the position. Throws InvariantViolation when a loop's
  parents can never all be placed.
*/
TaskPathway IterationTaskPathway(const std::vector<db::model::TaskRecord>& tasks, const std::vector<db::model::LoopRecord>& loops);

/*
  Compiles the pending runs of a workflow into jobscripts.

  Per (task, loop position): resource map -> grouping -> jobscript records
  with their run-ID matrix and the runs each element waits on. Then
  cross-jobscript dependencies are resolved, array-compatible jobscripts
  merged and the result renumbered.
*/
class JobscriptPlanner {
 public:
  JobscriptPlanner(store::PersistentStore& store, ResourceResolver& resolver);

  // Empty task_indices plans every task.
  std::vector<db::model::JobscriptRecord> Plan(const std::vector<uint64_t>& task_indices = {});

  // Stages a submission of the jobscripts and points their runs at it.
  uint64_t AddSubmission(std::vector<db::model::JobscriptRecord> jobscripts);

 private:
  store::PersistentStore& store_;
  ResourceResolver&       resolver_;
};

} // namespace jobflow::scheduling
