#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace jobflow::db::model {

struct IterableParameter {
  uint64_t              input_task = 0;
  std::vector<uint64_t> output_tasks;
};

// Parent-loop iteration indices -> number of iterations added under them.
using IterationCounts = std::map<std::vector<int64_t>, int64_t>;

/*
  Iterative sub-range of contiguous tasks.

  Iteration-count keys always have one component per parent loop.
*/

struct LoopRecord {
  uint64_t    id = 0;
  std::string name;

  std::vector<uint64_t>    task_indices;
  std::vector<std::string> parents;
  IterationCounts          num_added_iterations;

  std::map<std::string, IterableParameter> iterable_parameters;

  LoopRecord WithNumIterations(const std::vector<int64_t>& parent_idx, int64_t num_iterations) const;
  LoopRecord WithParents(std::vector<std::string> new_parents, IterationCounts counts) const;

  // Throws InvariantViolation on a non-contiguous task range or on
  // iteration-count keys whose length does not match the parent list.
  void Validate() const;
};

// Input/output parameter types declared by one task of a loop.
struct TaskParameterTypes {
  uint64_t              index = 0;
  std::set<std::string> inputs;
  std::set<std::string> outputs;
};

/*
  A parameter type is iterable when a loop task consumes it and the same or
  a later loop task produces it.
*/
std::map<std::string, IterableParameter> FindIterableParameters(const std::vector<TaskParameterTypes>& loop_tasks);

/*
  A task after the loop's range may only consume an iterable parameter once
  the loop has recorded its iteration counts.
*/
void ValidateDownstreamInput(const LoopRecord& loop, uint64_t task_index, const std::string& parameter_type);

} // namespace jobflow::db::model
