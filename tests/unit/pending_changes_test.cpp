#include "internal/store/pending_changes.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

using jobflow::db::CommitStep;
using jobflow::db::model::IterationRecord;
using jobflow::db::model::LoopRecord;
using jobflow::db::model::ParameterRecord;
using jobflow::db::model::RunRecord;
using jobflow::db::model::TaskRecord;
using jobflow::store::PendingChanges;

void TestEmptyStage() {
  PendingChanges pending;
  assert(pending.IsEmpty());
  assert(pending.Describe() == "none");
  for (auto step : jobflow::db::kCommitOrder) assert(!pending.HasWork(step));
}

void TestOverlayAppendsWithoutTouchingTheInput() {
  PendingChanges pending;
  pending.add_element_ids[4] = {10, 11};

  TaskRecord durable;
  durable.id          = 4;
  durable.element_ids = {9};

  const auto merged = pending.Overlay(durable);
  assert((merged.element_ids == std::vector<uint64_t>{9, 10, 11}));
  assert((durable.element_ids == std::vector<uint64_t>{9}));

  TaskRecord other;
  other.id = 5;
  assert(pending.Overlay(other).element_ids.empty());
}

void TestIterationOverlay() {
  PendingChanges pending;
  pending.add_run_ids[2][0] = {7};
  pending.add_run_ids[2][1] = {8};
  pending.set_runs_initialised.insert(2);
  pending.update_loop_indices[2]["outer"] = 3;

  IterationRecord iteration;
  iteration.id                = 2;
  iteration.loop_idx["inner"] = 1;

  const auto merged = pending.Overlay(iteration);
  assert(merged.runs_initialised);
  assert((merged.run_ids.at(0) == std::vector<uint64_t>{7}));
  assert((merged.run_ids.at(1) == std::vector<uint64_t>{8}));
  assert(merged.loop_idx.at("inner") == 1);
  assert(merged.loop_idx.at("outer") == 3);
}

void TestRunOverlayFollowsLifecycle() {
  PendingChanges pending;
  pending.set_run_submission_idx[0] = 3;
  pending.set_run_starts[0]         = jobflow::store::RunStart{jobflow::util::Now(), std::nullopt, "node01"};

  RunRecord run;
  run.id = 0;
  assert(run.Status() == jobflow::db::model::RunStatus::kPending);

  const auto merged = pending.Overlay(run);
  assert(merged.submission_idx == 3);
  assert(merged.run_hostname == std::string("node01"));
  assert(merged.Status() == jobflow::db::model::RunStatus::kRunning);
}

void TestParameterOverlay() {
  PendingChanges pending;
  google::protobuf::Value value;
  value.set_string_value("x");
  pending.set_parameters[1].value           = value;
  pending.update_param_sources[1]["run_id"] = int64_t{5};

  ParameterRecord param;
  param.id             = 1;
  param.source["type"] = std::string("run_output");

  const auto merged = pending.Overlay(param);
  assert(merged.is_set);
  assert(merged.data.string_value() == "x");
  assert(std::get<int64_t>(merged.source.at("run_id")) == 5);
  assert(std::get<std::string>(merged.source.at("type")) == "run_output");
}

void TestLoopOverlayAppliesParentsLast() {
  PendingChanges pending;
  pending.update_loop_num_iterations[0][std::vector<int64_t>{}] = 4;
  pending.update_loop_parents[0]                                = jobflow::store::LoopParentsUpdate{{"outer"}, {{{0}, 2}}};

  LoopRecord loop;
  loop.id           = 0;
  loop.name         = "inner";
  loop.task_indices = {0};

  const auto merged = pending.Overlay(loop);
  assert((merged.parents == std::vector<std::string>{"outer"}));
  assert(merged.num_added_iterations.size() == 1);
  assert(merged.num_added_iterations.at({0}) == 2);
}

void TestPruneDropsFoldedUpdates() {
  PendingChanges pending;
  pending.add_run_ids[1][0] = {3};
  pending.set_runs_initialised.insert(1);
  pending.set_run_skips.insert(3);
  pending.set_run_submission_idx[3] = 0;

  assert(pending.EntryCount(CommitStep::kRunIds) == 1);
  assert(pending.Describe() == "run_ids=1 runs_initialised=1 run_submission_indices=1 run_skips=1");

  pending.PruneIteration(1);
  pending.PruneRun(3);
  assert(pending.IsEmpty());
}

void TestResetClearsEverything() {
  PendingChanges pending;
  pending.add_tasks.emplace(0, TaskRecord{});
  pending.add_template_components["parameters"]["abc"] = google::protobuf::Struct();
  assert(pending.EntryCount(CommitStep::kTemplateComponents) == 1);
  assert(!pending.IsEmpty());

  pending.Reset();
  assert(pending.IsEmpty());
}

} // namespace

int main() {
  TestEmptyStage();
  TestOverlayAppendsWithoutTouchingTheInput();
  TestIterationOverlay();
  TestRunOverlayFollowsLifecycle();
  TestParameterOverlay();
  TestLoopOverlayAppliesParentsLast();
  TestPruneDropsFoldedUpdates();
  TestResetClearsEverything();

  std::cout << "jobflow_unit_pending_changes: pass\n";
  return 0;
}
