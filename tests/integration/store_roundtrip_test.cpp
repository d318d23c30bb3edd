#include <arrow/buffer.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/factory.hpp"
#include "internal/util/time.hpp"

namespace {

using jobflow::db::model::DataIndex;
using jobflow::db::model::JobscriptRecord;
using jobflow::db::model::ParamSource;
using jobflow::db::model::RunOutputSource;
using jobflow::db::model::RunStatus;
using jobflow::runtime::config::RuntimeConfig;
using jobflow::store::PersistentStore;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

google::protobuf::Value Number(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

ParamSource LocalInput() {
  return ParamSource{{"type", std::string("local_input")}};
}

struct Ids {
  uint64_t task       = 0;
  uint64_t iteration  = 0;
  uint64_t run        = 0;
  uint64_t input      = 0;
  uint64_t output     = 0;
  uint64_t file       = 0;
  uint64_t loop       = 0;
  uint64_t submission = 0;
};

/*
  One task with two elements, a run on the first, a loop over the task and
  a submission of that run. Everything is committed in a single batch.
*/
Ids PopulateWorkflow(PersistentStore& store) {
  Ids ids;

  jobflow::db::model::WorkflowInfo info;
  info.name                 = "simulate_sweep";
  info.creation.app_name    = "jobflow";
  info.creation.app_version = "0.1.0";
  info.creation.create_time = jobflow::util::Now();
  store.CreateWorkflow(info);

  PersistentStore::BatchScope batch(store);

  google::protobuf::Struct tmpl;
  (*tmpl.mutable_fields())["name"].set_string_value("simulate");
  ids.task = store.AddTask(0, tmpl);

  google::protobuf::Struct element_set;
  (*element_set.mutable_fields())["repeats"].set_number_value(2);
  const auto es_idx = store.AddElementSet(ids.task, element_set);

  const auto first = store.AddElement(ids.task, es_idx, {{"inputs.p", 0}}, {});
  store.AddElement(ids.task, es_idx, {{"inputs.p", 1}}, {});

  ids.input     = store.AddSetParameter(Number(3), LocalInput());
  ids.iteration = store.AddElementIteration(first, {{"inputs.p", ids.input}}, {"inputs.p"});
  store.SetRunsInitialised(ids.iteration);

  ids.output     = store.AddUnsetParameter(RunOutputSource(store.NumRuns()));
  DataIndex data = {{"inputs.p", ids.input}, {"outputs.q", ids.output}};
  ids.run        = store.AddRun(ids.iteration, 0, {0}, data);

  ids.file = store.AddFile(true, "inputs/config.txt", LocalInput(), std::string("threads=4\n"));

  ids.loop = store.AddLoop("converge", {0}, {});
  store.UpdateLoopNumIterations(ids.loop, {}, 2);

  JobscriptRecord js;
  js.resource_hash   = "h";
  js.task_insert_ids = {ids.task};
  js.run_ids         = {{static_cast<int64_t>(ids.run)}};
  ids.submission     = store.AddSubmission({js});
  store.SetRunSubmissionIndex({ids.run}, static_cast<int64_t>(ids.submission));
  store.AddSubmissionPart(ids.submission, jobflow::util::Now(), {0});

  store.SetRunStart(ids.run, jobflow::util::Now(), std::nullopt, "node01");
  store.SetRunEnd(ids.run, jobflow::util::Now(), std::nullopt, 0, true);
  store.SetParameterValue(ids.output, Number(9));

  google::protobuf::Struct component;
  (*component.mutable_fields())["type"].set_string_value("float");
  store.AddTemplateComponents({{jobflow::db::model::kComponentParameters, {{"c0", component}}}});

  assert(store.HasPending());
  batch.Commit();
  assert(!store.HasPending());
  return ids;
}

void VerifyReopened(PersistentStore& store, const Ids& ids) {
  assert(!store.HasPending());

  assert(store.NumTasks() == 1);
  assert(store.NumElements() == 2);
  assert(store.NumIterations() == 1);
  assert(store.NumRuns() == 1);
  assert(store.NumParameters() == 3);
  assert(store.NumLoops() == 1);
  assert(store.NumSubmissions() == 1);

  const auto task = store.GetTasks({ids.task}).front();
  assert(task.task_template.fields().at("name").string_value() == "simulate");
  assert(task.element_sets.size() == 1);
  assert(task.element_ids.size() == 2);

  const auto elements = store.GetTaskElements(ids.task);
  assert(elements.size() == 2);
  assert(elements[1].element.seq_idx.at("inputs.p") == 1);
  assert(elements[0].iterations.size() == 1);
  assert(elements[0].iterations[0].iteration.runs_initialised);
  assert(elements[0].iterations[0].runs.at(0).size() == 1);

  const auto run = store.GetRuns({ids.run}).front();
  assert(run.Status() == RunStatus::kSuccess);
  assert(run.submission_idx == static_cast<int64_t>(ids.submission));
  assert(run.run_hostname == std::string("node01"));
  assert(run.exit_code == 0);

  const auto params = store.GetParameters({ids.input, ids.output});
  assert(params[0].data.number_value() == 3);
  assert(params[1].is_set);
  assert(params[1].data.number_value() == 9);
  assert((store.GetParameterSources({ids.output}).front() == RunOutputSource(ids.run)));

  assert(store.GetFileContents(ids.file)->ToString() == "threads=4\n");

  const auto loop = store.GetLoops({ids.loop}).front();
  assert(loop.name == "converge");
  assert(loop.num_added_iterations.at({}) == 2);

  const auto submission = store.GetSubmissions({ids.submission}).front();
  assert(submission.jobscripts.size() == 1);
  assert(submission.submission_parts.size() == 1);
  assert((submission.submission_parts[0].jobscript_indices == std::vector<uint64_t>{0}));

  assert(store.GetTemplateComponents().at(jobflow::db::model::kComponentParameters).contains("c0"));

  const auto info = store.GetWorkflowInfo();
  assert(info.name == "simulate_sweep");
  assert(info.creation.app_name == "jobflow");
}

void RoundTrip(const std::string& name, RuntimeConfig config) {
  Ids ids;
  {
    auto workflow = jobflow::factory::Build(config);
    ids           = PopulateWorkflow(*workflow.store);
  }

  auto reopened = jobflow::factory::Build(config);
  VerifyReopened(*reopened.store, ids);

  // new IDs continue after the durable ones
  assert(reopened.store->AddTask(1, {}) == 1);

  std::cout << "store round trip passed for backend: " << name << "\n";
}

} // namespace

int main() {
  const auto base = std::filesystem::temp_directory_path() / ("jobflow_integration_roundtrip_" + std::to_string(NowMs()));

  RuntimeConfig json;
  json.mutable_store()->mutable_json()->set_path((base / "json").string());
  json.mutable_content()->set_root_path((base / "json_contents").string());
  RoundTrip("json", json);

#if JOBFLOW_DB_SQLITE
  std::filesystem::create_directories(base);
  RuntimeConfig sqlite;
  sqlite.mutable_store()->mutable_sqlite()->set_path((base / "workflow.db").string());
  sqlite.mutable_store()->set_use_cache(true);
  sqlite.mutable_content()->set_root_path((base / "sqlite_contents").string());
  RoundTrip("sqlite", sqlite);
#endif

  std::filesystem::remove_all(base);

  std::cout << "jobflow_integration_store_roundtrip: pass\n";
  return 0;
}
