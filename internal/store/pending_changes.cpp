#include "internal/store/pending_changes.hpp"

#include <sstream>

namespace jobflow::store {

using db::CommitStep;
namespace model = db::model;

bool PendingChanges::IsEmpty() const {
  for (auto step : db::kCommitOrder) {
    if (HasWork(step)) return false;
  }
  return true;
}

void PendingChanges::Reset() {
  *this = PendingChanges{};
}

bool PendingChanges::HasWork(CommitStep step) const {
  return EntryCount(step) != 0;
}

size_t PendingChanges::EntryCount(CommitStep step) const {
  switch (step) {
    case CommitStep::kTasks:
      return add_tasks.size();
    case CommitStep::kLoops:
      return add_loops.size();
    case CommitStep::kSubmissions:
      return add_submissions.size();
    case CommitStep::kSubmissionParts:
      return add_submission_parts.size();
    case CommitStep::kElementIds:
      return add_element_ids.size();
    case CommitStep::kElements:
      return add_elements.size();
    case CommitStep::kElementSets:
      return add_element_sets.size();
    case CommitStep::kIterationIds:
      return add_iteration_ids.size();
    case CommitStep::kIterations:
      return add_iterations.size();
    case CommitStep::kRunIds:
      return add_run_ids.size();
    case CommitStep::kRunsInitialised:
      return set_runs_initialised.size();
    case CommitStep::kRuns:
      return add_runs.size();
    case CommitStep::kRunSubmissionIndices:
      return set_run_submission_idx.size();
    case CommitStep::kRunSkips:
      return set_run_skips.size();
    case CommitStep::kRunStarts:
      return set_run_starts.size();
    case CommitStep::kRunEnds:
      return set_run_ends.size();
    case CommitStep::kJobscriptMetadata:
      return set_jobscript_metadata.size();
    case CommitStep::kParameters:
      return add_parameters.size() + set_parameters.size();
    case CommitStep::kFiles:
      return add_files.size();
    case CommitStep::kTemplateComponents: {
      size_t n = 0;
      for (const auto& [type, by_hash] : add_template_components) n += by_hash.size();
      return n;
    }
    case CommitStep::kParameterSources:
      return update_param_sources.size();
    case CommitStep::kLoopIndices:
      return update_loop_indices.size();
    case CommitStep::kLoopNumIterations:
      return update_loop_num_iterations.size();
    case CommitStep::kLoopParents:
      return update_loop_parents.size();
  }
  return 0;
}

std::string PendingChanges::Describe() const {
  std::ostringstream out;
  bool               first = true;
  for (auto step : db::kCommitOrder) {
    const auto n = EntryCount(step);
    if (n == 0) continue;
    if (!first) out << ' ';
    first = false;
    out << db::CommitStepName(step) << '=' << n;
  }
  return first ? "none" : out.str();
}

// ------------------------------------------------------------------
// Overlay
// ------------------------------------------------------------------

model::TaskRecord PendingChanges::Overlay(model::TaskRecord record) const {
  if (auto it = add_element_ids.find(record.id); it != add_element_ids.end()) {
    record = record.WithElementIds(it->second);
  }
  if (auto it = add_element_sets.find(record.id); it != add_element_sets.end()) {
    record = record.WithElementSets(it->second);
  }
  return record;
}

model::ElementRecord PendingChanges::Overlay(model::ElementRecord record) const {
  if (auto it = add_iteration_ids.find(record.id); it != add_iteration_ids.end()) {
    record = record.WithIterationIds(it->second);
  }
  return record;
}

model::IterationRecord PendingChanges::Overlay(model::IterationRecord record) const {
  if (auto it = add_run_ids.find(record.id); it != add_run_ids.end()) {
    for (const auto& [action_idx, ids] : it->second) record = record.WithRunIds(action_idx, ids);
  }
  if (set_runs_initialised.contains(record.id)) {
    record = record.WithRunsInitialised();
  }
  if (auto it = update_loop_indices.find(record.id); it != update_loop_indices.end()) {
    record = record.WithLoopIdx(it->second);
  }
  return record;
}

model::RunRecord PendingChanges::Overlay(model::RunRecord record) const {
  if (auto it = set_run_submission_idx.find(record.id); it != set_run_submission_idx.end()) {
    record = record.WithSubmissionIdx(it->second);
  }
  if (set_run_skips.contains(record.id)) {
    record = record.WithSkip();
  }
  if (auto it = set_run_starts.find(record.id); it != set_run_starts.end()) {
    record = record.WithStart(it->second.time, it->second.snapshot, it->second.hostname);
  }
  if (auto it = set_run_ends.find(record.id); it != set_run_ends.end()) {
    record = record.WithEnd(it->second.time, it->second.snapshot, it->second.exit_code, it->second.success);
  }
  return record;
}

model::ParameterRecord PendingChanges::Overlay(model::ParameterRecord record) const {
  if (auto it = set_parameters.find(record.id); it != set_parameters.end()) {
    if (it->second.file) {
      record = record.WithFile(*it->second.file);
    } else if (it->second.array) {
      record = record.WithArray(*it->second.array);
    } else if (it->second.value) {
      record = record.WithValue(*it->second.value, it->second.type_lookup);
    }
  }
  if (auto it = update_param_sources.find(record.id); it != update_param_sources.end()) {
    record = record.WithSource(it->second);
  }
  return record;
}

model::LoopRecord PendingChanges::Overlay(model::LoopRecord record) const {
  if (auto it = update_loop_num_iterations.find(record.id); it != update_loop_num_iterations.end()) {
    for (const auto& [parent_idx, num] : it->second) record = record.WithNumIterations(parent_idx, num);
  }
  if (auto it = update_loop_parents.find(record.id); it != update_loop_parents.end()) {
    record = record.WithParents(it->second.parents, it->second.counts);
  }
  return record;
}

model::SubmissionRecord PendingChanges::Overlay(model::SubmissionRecord record) const {
  if (auto it = add_submission_parts.find(record.id); it != add_submission_parts.end()) {
    record = record.WithParts(it->second);
  }
  if (auto it = set_jobscript_metadata.find(record.id); it != set_jobscript_metadata.end()) {
    for (const auto& [js_idx, update] : it->second) record = record.WithJobscriptMetadata(js_idx, update);
  }
  return record;
}

// ------------------------------------------------------------------
// Pruning
// ------------------------------------------------------------------

void PendingChanges::PruneTask(uint64_t id) {
  add_element_ids.erase(id);
  add_element_sets.erase(id);
}

void PendingChanges::PruneElement(uint64_t id) {
  add_iteration_ids.erase(id);
}

void PendingChanges::PruneIteration(uint64_t id) {
  add_run_ids.erase(id);
  set_runs_initialised.erase(id);
  update_loop_indices.erase(id);
}

void PendingChanges::PruneRun(uint64_t id) {
  set_run_submission_idx.erase(id);
  set_run_skips.erase(id);
  set_run_starts.erase(id);
  set_run_ends.erase(id);
}

void PendingChanges::PruneParameter(uint64_t id) {
  set_parameters.erase(id);
  update_param_sources.erase(id);
}

void PendingChanges::PruneLoop(uint64_t id) {
  update_loop_num_iterations.erase(id);
  update_loop_parents.erase(id);
}

void PendingChanges::PruneSubmission(uint64_t id) {
  add_submission_parts.erase(id);
  set_jobscript_metadata.erase(id);
}

} // namespace jobflow::store
