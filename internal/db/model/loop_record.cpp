#include "internal/db/model/loop_record.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace jobflow::db::model {

namespace {

std::string KeyString(const std::vector<int64_t>& key) {
  std::string out = "(";
  for (size_t i = 0; i < key.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(key[i]);
  }
  return out + ")";
}

void ValidateKeys(const std::string& loop_name, const IterationCounts& counts, size_t num_parents) {
  for (const auto& [key, num] : counts) {
    if (key.size() != num_parents) {
      throw util::InvariantViolation("loop " + loop_name + ": iteration key " + KeyString(key) + " must have " + std::to_string(num_parents) +
                                     " component(s), one per parent loop");
    }
    if (num < 0) {
      throw util::InvariantViolation("loop " + loop_name + ": negative iteration count for key " + KeyString(key));
    }
  }
}

} // namespace

LoopRecord LoopRecord::WithNumIterations(const std::vector<int64_t>& parent_idx, int64_t num_iterations) const {
  IterationCounts single{{parent_idx, num_iterations}};
  ValidateKeys(name, single, parents.size());

  auto existing = num_added_iterations.find(parent_idx);
  if (existing != num_added_iterations.end() && num_iterations < existing->second) {
    throw util::InvariantViolation("loop " + name + ": iteration count for " + KeyString(parent_idx) + " cannot decrease from " +
                                   std::to_string(existing->second) + " to " + std::to_string(num_iterations));
  }

  LoopRecord next                       = *this;
  next.num_added_iterations[parent_idx] = num_iterations;
  return next;
}

LoopRecord LoopRecord::WithParents(std::vector<std::string> new_parents, IterationCounts counts) const {
  ValidateKeys(name, counts, new_parents.size());
  LoopRecord next           = *this;
  next.parents              = std::move(new_parents);
  next.num_added_iterations = std::move(counts);
  return next;
}

void LoopRecord::Validate() const {
  if (task_indices.empty()) {
    throw util::InvariantViolation("loop " + name + " must include at least one task");
  }
  for (size_t i = 1; i < task_indices.size(); ++i) {
    if (task_indices[i] != task_indices[i - 1] + 1) {
      throw util::InvariantViolation("loop " + name + ": task indices must be a contiguous ascending range");
    }
  }
  ValidateKeys(name, num_added_iterations, parents.size());
}

std::map<std::string, IterableParameter> FindIterableParameters(const std::vector<TaskParameterTypes>& loop_tasks) {
  std::map<std::string, uint64_t>              first_input;
  std::map<std::string, std::vector<uint64_t>> outputs;

  for (const auto& task : loop_tasks) {
    for (const auto& type : task.inputs) first_input.try_emplace(type, task.index);
    for (const auto& type : task.outputs) outputs[type].push_back(task.index);
  }

  std::map<std::string, IterableParameter> iterable;
  for (const auto& [type, input_task] : first_input) {
    auto produced = outputs.find(type);
    if (produced == outputs.end() || produced->second.front() < input_task) continue;
    iterable[type] = IterableParameter{input_task, produced->second};
  }
  return iterable;
}

void ValidateDownstreamInput(const LoopRecord& loop, uint64_t task_index, const std::string& parameter_type) {
  if (loop.task_indices.empty() || task_index <= loop.task_indices.back()) return;
  if (!loop.iterable_parameters.contains(parameter_type)) return;
  if (!loop.num_added_iterations.empty()) return;

  throw util::InvariantViolation("task " + std::to_string(task_index) + " consumes parameter type " + parameter_type + " which is still iterable in loop " +
                                 loop.name);
}

} // namespace jobflow::db::model
