#include "internal/store/persistent_store.hpp"

#include <arrow/builder.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/ram/ram_content_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobflow::db::AccessMode;
using jobflow::db::EntityKind;
using jobflow::db::Repository;
using jobflow::db::Result;
using jobflow::db::Transaction;
using jobflow::db::memory::MemoryRepository;
using jobflow::store::PersistentStore;
using jobflow::util::AlreadyExists;
using jobflow::util::InvariantViolation;
using jobflow::util::NotFound;

namespace model = jobflow::db::model;

/*
  Memory backend that reports one resource per document, like the JSON
  backend, and can be told to fail parameter inserts.
*/
class FaultInjectingRepository final : public Repository {
 public:
  bool fail_parameter_inserts = false;

  std::string BackendName() const override {
    return "fault-injecting";
  }

  std::vector<std::string> ResourcesFor(EntityKind kind) const override {
    switch (kind) {
      case EntityKind::kParameter:
        return {"parameters"};
      case EntityKind::kSubmission:
        return {"submissions"};
      default:
        return {"metadata"};
    }
  }

  std::unique_ptr<Transaction> Begin(const std::vector<std::string>& resources, AccessMode mode) override {
    return inner_.Begin(resources, mode);
  }

  Result InsertTask(Transaction& tx, const model::TaskRecord& r) override {
    return inner_.InsertTask(tx, r);
  }
  Result UpdateTask(Transaction& tx, const model::TaskRecord& r) override {
    return inner_.UpdateTask(tx, r);
  }
  std::optional<model::TaskRecord> GetTask(Transaction& tx, uint64_t id) override {
    return inner_.GetTask(tx, id);
  }
  uint64_t CountTasks(Transaction& tx) override {
    return inner_.CountTasks(tx);
  }

  Result InsertElement(Transaction& tx, const model::ElementRecord& r) override {
    return inner_.InsertElement(tx, r);
  }
  Result UpdateElement(Transaction& tx, const model::ElementRecord& r) override {
    return inner_.UpdateElement(tx, r);
  }
  std::optional<model::ElementRecord> GetElement(Transaction& tx, uint64_t id) override {
    return inner_.GetElement(tx, id);
  }
  uint64_t CountElements(Transaction& tx) override {
    return inner_.CountElements(tx);
  }

  Result InsertIteration(Transaction& tx, const model::IterationRecord& r) override {
    return inner_.InsertIteration(tx, r);
  }
  Result UpdateIteration(Transaction& tx, const model::IterationRecord& r) override {
    return inner_.UpdateIteration(tx, r);
  }
  std::optional<model::IterationRecord> GetIteration(Transaction& tx, uint64_t id) override {
    return inner_.GetIteration(tx, id);
  }
  uint64_t CountIterations(Transaction& tx) override {
    return inner_.CountIterations(tx);
  }

  Result InsertRun(Transaction& tx, const model::RunRecord& r) override {
    return inner_.InsertRun(tx, r);
  }
  Result UpdateRun(Transaction& tx, const model::RunRecord& r) override {
    return inner_.UpdateRun(tx, r);
  }
  std::optional<model::RunRecord> GetRun(Transaction& tx, uint64_t id) override {
    return inner_.GetRun(tx, id);
  }
  uint64_t CountRuns(Transaction& tx) override {
    return inner_.CountRuns(tx);
  }

  Result InsertParameter(Transaction& tx, const model::ParameterRecord& r) override {
    if (fail_parameter_inserts) return Result::Err(jobflow::db::ErrorCode::IOError, "injected parameter failure");
    return inner_.InsertParameter(tx, r);
  }
  Result UpdateParameter(Transaction& tx, const model::ParameterRecord& r) override {
    return inner_.UpdateParameter(tx, r);
  }
  std::optional<model::ParameterRecord> GetParameter(Transaction& tx, uint64_t id) override {
    return inner_.GetParameter(tx, id);
  }
  uint64_t CountParameters(Transaction& tx) override {
    return inner_.CountParameters(tx);
  }

  Result InsertLoop(Transaction& tx, const model::LoopRecord& r) override {
    return inner_.InsertLoop(tx, r);
  }
  Result UpdateLoop(Transaction& tx, const model::LoopRecord& r) override {
    return inner_.UpdateLoop(tx, r);
  }
  std::optional<model::LoopRecord> GetLoop(Transaction& tx, uint64_t id) override {
    return inner_.GetLoop(tx, id);
  }
  uint64_t CountLoops(Transaction& tx) override {
    return inner_.CountLoops(tx);
  }

  Result InsertSubmission(Transaction& tx, const model::SubmissionRecord& r) override {
    return inner_.InsertSubmission(tx, r);
  }
  Result UpdateSubmission(Transaction& tx, const model::SubmissionRecord& r) override {
    return inner_.UpdateSubmission(tx, r);
  }
  std::optional<model::SubmissionRecord> GetSubmission(Transaction& tx, uint64_t id) override {
    return inner_.GetSubmission(tx, id);
  }
  uint64_t CountSubmissions(Transaction& tx) override {
    return inner_.CountSubmissions(tx);
  }

  model::TemplateComponents GetTemplateComponents(Transaction& tx) override {
    return inner_.GetTemplateComponents(tx);
  }
  Result MergeTemplateComponents(Transaction& tx, const model::TemplateComponents& components) override {
    return inner_.MergeTemplateComponents(tx, components);
  }
  std::optional<model::WorkflowInfo> GetWorkflowInfo(Transaction& tx) override {
    return inner_.GetWorkflowInfo(tx);
  }
  Result InsertWorkflowInfo(Transaction& tx, const model::WorkflowInfo& info) override {
    return inner_.InsertWorkflowInfo(tx, info);
  }

 private:
  MemoryRepository inner_;
};

std::unique_ptr<PersistentStore> MakeStore(std::shared_ptr<Repository> repo = std::make_shared<MemoryRepository>()) {
  return std::make_unique<PersistentStore>(std::move(repo), std::make_shared<jobflow::storage::RamContentStore>());
}

google::protobuf::Value Number(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

template <typename Error, typename Fn>
bool Throws(Fn fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

// task 0 -> element 0 -> iteration 0 -> run 0 (action 0), with one input parameter
struct SmallWorkflow {
  uint64_t task;
  uint64_t element;
  uint64_t iteration;
  uint64_t run;
  uint64_t input;
};

SmallWorkflow AddSmallWorkflow(PersistentStore& store) {
  SmallWorkflow wf{};
  wf.input     = store.AddSetParameter(Number(3), {{"type", std::string("local_input")}});
  wf.task      = store.AddTask(store.NumTasks(), {});
  wf.element   = store.AddElement(wf.task, 0, {{"inputs.x", 0}}, {});
  wf.iteration = store.AddElementIteration(wf.element, {{"inputs.x", wf.input}}, {"inputs.x"});
  wf.run       = store.AddRun(wf.iteration, 0, {0}, {{"inputs.x", wf.input}});
  return wf;
}

void TestIdsAreAllocatedInCallOrder() {
  auto store = MakeStore();

  assert(store->AddTask(0, {}) == 0);
  assert(store->AddTask(1, {}) == 1);
  assert(store->NumTasks() == 2);

  store->CommitAll();
  assert(!store->HasPending());

  // new IDs continue after the durable ones
  assert(store->AddTask(2, {}) == 2);
  assert(store->NumTasks() == 3);
  assert(store->AddSetParameter(Number(1), {}) == 0);
  assert(store->AddUnsetParameter({}) == 1);
}

void TestReadYourWrites() {
  auto       store = MakeStore();
  const auto wf    = AddSmallWorkflow(*store);

  const auto task = store->GetTasks({wf.task}).front();
  assert((task.element_ids == std::vector<uint64_t>{wf.element}));

  const auto element = store->GetElements({wf.element}).front();
  assert(element.index == 0);
  assert((element.iteration_ids == std::vector<uint64_t>{wf.iteration}));

  const auto iteration = store->GetIterations({wf.iteration}).front();
  assert((iteration.run_ids.at(0) == std::vector<uint64_t>{wf.run}));
  assert(!iteration.runs_initialised);

  store->SetRunsInitialised(wf.iteration);
  assert(store->GetIterations({wf.iteration}).front().runs_initialised);

  // reads keep the requested order, pending and durable alike
  store->CommitAll();
  auto second = store->AddTask(1, {});
  auto tasks  = store->GetTasks({second, wf.task});
  assert(tasks[0].id == second);
  assert(tasks[1].id == wf.task);
}

void TestUnknownIdsAreRejected() {
  auto store = MakeStore();
  assert(Throws<NotFound>([&] { store->AddElement(3, 0, {}, {}); }));
  assert(Throws<NotFound>([&] { (void)store->GetTasks({0}); }));
  assert(Throws<NotFound>([&] { store->SetRunSkip(0); }));
  assert(!store->HasPending());

  store->AddSetParameter(Number(1), {});
  assert((store->CheckParametersExist({0, 1}) == std::vector<bool>{true, false}));
}

void TestIterationRequiresSchemaParameters() {
  auto store   = MakeStore();
  auto task    = store->AddTask(0, {});
  auto element = store->AddElement(task, 0, {}, {});

  assert(Throws<InvariantViolation>([&] { store->AddElementIteration(element, {}, {"inputs.x"}); }));
  assert(store->NumIterations() == 0);
  assert(store->GetElements({element}).front().iteration_ids.empty());
}

void TestParameterCannotBeSetTwice() {
  auto store = MakeStore();
  auto param = store->AddUnsetParameter({{"type", std::string("run_output")}});
  assert((store->GetParameterSetStatuses({param}) == std::vector<bool>{false}));

  store->SetParameterValue(param, Number(1));
  assert(Throws<InvariantViolation>([&] { store->SetParameterValue(param, Number(2)); }));
  assert(store->GetParameters({param}).front().data.number_value() == 1);

  store->CommitAll();
  assert(Throws<InvariantViolation>([&] { store->SetParameterValue(param, Number(2)); }));
  assert(!store->HasPending());
  assert(store->GetParameters({param}).front().data.number_value() == 1);

  store->UpdateParameterSource(param, {{"run_id", int64_t{4}}});
  const auto sources = store->GetParameterSources({param});
  assert(std::get<int64_t>(sources.front().at("run_id")) == 4);
  assert(std::get<std::string>(sources.front().at("type")) == "run_output");
}

void TestUpdatesOnPendingEntitiesAreFoldedIn() {
  auto       store = MakeStore();
  const auto wf    = AddSmallWorkflow(*store);

  store->SetRunsInitialised(wf.iteration);
  store->SetRunSubmissionIndex({wf.run}, 0);
  store->SetRunStart(wf.run, jobflow::util::Now(), std::nullopt, "node01");
  store->CommitAll();
  assert(!store->HasPending());

  const auto run = store->GetRuns({wf.run}).front();
  assert(run.submission_idx == 0);
  assert(run.run_hostname == std::string("node01"));
  assert(run.Status() == model::RunStatus::kRunning);
  assert(store->GetIterations({wf.iteration}).front().runs_initialised);

  store->SetRunEnd(wf.run, jobflow::util::Now(), std::nullopt, 0, true);
  store->CommitAll();
  assert(store->GetRuns({wf.run}).front().Status() == model::RunStatus::kSuccess);
}

void TestTaskElementsView() {
  auto       store = MakeStore();
  const auto wf    = AddSmallWorkflow(*store);
  store->AddRun(wf.iteration, 1, {0}, {});
  store->AddElement(wf.task, 0, {}, {});
  store->CommitAll();

  auto views = store->GetTaskElements(wf.task);
  assert(views.size() == 2);
  assert(views[0].iterations.size() == 1);
  assert(views[0].iterations[0].runs.at(0).front().id == wf.run);
  assert(views[0].iterations[0].runs.at(1).size() == 1);
  assert(views[1].iterations.empty());

  assert(store->GetTaskElements(wf.task, {1}).front().element.index == 1);
  assert(Throws<NotFound>([&] { (void)store->GetTaskElements(wf.task, {2}); }));
}

void TestSaveAndBatchScopes() {
  auto store = MakeStore();

  // nothing pending, nothing to do
  store->Save();

  {
    PersistentStore::BatchScope outer(*store);
    store->AddTask(0, {});
    {
      PersistentStore::BatchScope inner(*store);
      store->AddTask(1, {});
      inner.Commit();
    }
    // the inner commit does not save while the outer batch is open
    assert(store->HasPending());
    store->Save();
    assert(store->HasPending());
    outer.Commit();
  }
  assert(!store->HasPending());
  assert(store->NumTasks() == 2);

  {
    PersistentStore::BatchScope abandoned(*store);
    store->AddTask(2, {});
  }
  assert(!store->InBatchMode());
  assert(store->HasPending());
  store->Save();
  assert(!store->HasPending());
}

void TestFailedGroupKeepsItsBuckets() {
  auto repo  = std::make_shared<FaultInjectingRepository>();
  auto store = MakeStore(repo);
  assert(store->ResourceMap().Groups().size() == 3);

  const auto wf = AddSmallWorkflow(*store);
  repo->fail_parameter_inserts = true;

  bool threw = false;
  try {
    store->CommitAll();
  } catch (const jobflow::util::CommitFailure& e) {
    threw = true;
    assert(e.resources() == "parameters");
    assert(e.step() == "parameters");
  }
  assert(threw);

  // metadata landed; the parameter is still pending and still readable
  assert(store->HasPending());
  assert(store->Pending().add_parameters.size() == 1);
  assert(store->Pending().add_tasks.empty());
  assert(store->GetParameters({wf.input}).front().data.number_value() == 3);
  assert(store->GetRuns({wf.run}).front().iteration_id == wf.iteration);

  repo->fail_parameter_inserts = false;
  store->CommitAll();
  assert(!store->HasPending());
  store->Reload();
  assert(store->NumParameters() == 1);
  assert(store->GetParameters({wf.input}).front().data.number_value() == 3);
}

void TestLoopUpdatesKeepCallOrder() {
  auto store = MakeStore();
  store->AddTask(0, {});
  auto loop = store->AddLoop("inner", {0}, {});

  store->UpdateLoopNumIterations(loop, {}, 2);
  store->UpdateLoopParents(loop, {"outer"}, {{{0}, 2}});
  store->UpdateLoopNumIterations(loop, {1}, 3);

  auto check = [&] {
    const auto merged = store->GetLoops({loop}).front();
    assert((merged.parents == std::vector<std::string>{"outer"}));
    assert(merged.num_added_iterations.size() == 2);
    assert(merged.num_added_iterations.at({0}) == 2);
    assert(merged.num_added_iterations.at({1}) == 3);
  };
  check();
  store->CommitAll();
  check();

  // applied to the durable loop this time
  store->UpdateLoopParents(loop, {"outer"}, {{{0}, 2}, {{1}, 3}});
  store->UpdateLoopNumIterations(loop, {2}, 1);
  store->CommitAll();
  assert(store->GetLoops({loop}).front().num_added_iterations.size() == 3);

  assert(Throws<InvariantViolation>([&] { store->UpdateLoopNumIterations(loop, {}, 1); }));
  assert(Throws<InvariantViolation>([&] { store->AddLoop("gap", {0, 2}, {}); }));
}

void TestLoopIndexUpdatesMerge() {
  auto       store = MakeStore();
  const auto wf    = AddSmallWorkflow(*store);

  store->UpdateLoopIndex(wf.iteration, {{"inner", 0}});
  assert((store->GetIterations({wf.iteration}).front().loop_idx == model::LoopIndex{{"inner", 0}}));
  store->CommitAll();

  store->UpdateLoopIndex(wf.iteration, {{"outer", 1}});
  store->UpdateLoopIndex(wf.iteration, {{"inner", 2}});
  store->CommitAll();
  assert((store->GetIterations({wf.iteration}).front().loop_idx == model::LoopIndex{{"inner", 2}, {"outer", 1}}));

  assert(Throws<NotFound>([&] { store->UpdateLoopIndex(wf.iteration + 1, {{"inner", 0}}); }));
}

void TestDownstreamTaskCannotConsumeIterableParameter() {
  auto store = MakeStore();
  store->AddTask(0, {}, {"p"});
  auto loop = store->AddLoop("converge", {0}, {}, {}, {{0, {"p"}, {"p"}}});

  const auto iterable = store->GetLoops({loop}).front().iterable_parameters;
  assert(iterable.size() == 1);
  assert(iterable.at("p").input_task == 0);
  assert((iterable.at("p").output_tasks == std::vector<uint64_t>{0}));
  store->CommitAll();

  // rejected before anything is staged
  assert(Throws<InvariantViolation>([&] { store->AddTask(1, {}, {"p"}); }));
  assert(!store->HasPending());
  assert(store->NumTasks() == 1);

  store->AddTask(1, {}, {"q"});

  // a staged iteration count is enough
  store->UpdateLoopNumIterations(loop, {}, 3);
  assert(store->AddTask(2, {}, {"p"}) == 2);

  assert(Throws<InvariantViolation>([&] { store->AddLoop("outside", {0}, {}, {}, {{1, {"p"}, {}}}); }));
  assert(store->NumLoops() == 1);
}

void TestDataIndexMustReferenceKnownParameters() {
  auto store   = MakeStore();
  auto task    = store->AddTask(0, {});
  auto element = store->AddElement(task, 0, {}, {});
  store->CommitAll();

  assert(Throws<NotFound>([&] { store->AddElementIteration(element, {{"inputs.x", uint64_t{0}}}, {"inputs.x"}); }));
  assert(!store->HasPending());
  assert(store->NumIterations() == 0);

  auto input     = store->AddSetParameter(Number(1), {});
  auto iteration = store->AddElementIteration(element, {{"inputs.x", input}}, {"inputs.x"});

  model::DataIndex grouped = {{"inputs.x", model::ParameterIds{input, input + 1}}};
  assert(Throws<NotFound>([&] { store->AddRun(iteration, 0, {0}, grouped); }));
  assert(store->NumRuns() == 0);
  assert(store->GetIterations({iteration}).front().run_ids.empty());

  store->AddUnsetParameter({});
  assert(store->AddRun(iteration, 0, {0}, grouped) == 0);
}

std::shared_ptr<arrow::Array> Int64s(int64_t n) {
  arrow::Int64Builder builder;
  for (int64_t i = 0; i < n; ++i) jobflow::storage::common::Unwrap(builder.Append(i * i));
  std::shared_ptr<arrow::Array> out;
  jobflow::storage::common::Unwrap(builder.Finish(&out));
  return out;
}

void TestArrayParameters() {
  jobflow::store::StoreOptions options;
  options.array_chunk_length = 4;
  auto content = std::make_shared<jobflow::storage::RamContentStore>();
  auto store   = std::make_unique<PersistentStore>(std::make_shared<MemoryRepository>(), content, options);

  auto values = Int64s(6);
  auto param  = store->AddArrayParameter(values, {{"type", std::string("local_input")}}, {2, 3});

  // readable from the stage
  assert(store->GetParameterArray(param)->Equals(arrow::ChunkedArray(values)));
  const auto staged = store->GetParameters({param}).front();
  assert(staged.is_set);
  assert(staged.array->dtype == "int64");
  assert((staged.array->shape == std::vector<int64_t>{2, 3}));
  assert(!content->Exists(staged.array->content_key));

  store->CommitAll();
  assert(content->Exists(staged.array->content_key));
  auto stored = store->GetParameterArray(param);
  assert(stored->num_chunks() == 2);
  assert(std::static_pointer_cast<arrow::Int64Array>(stored->chunk(1))->Value(1) == 25);

  // shape must account for every value
  assert(Throws<InvariantViolation>([&] { store->AddArrayParameter(values, {}, {4, 2}); }));
  assert(!store->HasPending());

  auto unset = store->AddUnsetParameter({{"type", std::string("run_output")}});
  store->SetParameterArray(unset, Int64s(3));
  assert(Throws<InvariantViolation>([&] { store->SetParameterArray(unset, Int64s(3)); }));
  store->CommitAll();
  assert(store->GetParameterArray(unset)->length() == 3);
  assert((store->GetParameters({unset}).front().array->shape == std::vector<int64_t>{3}));

  assert(Throws<NotFound>([&] { (void)store->GetParameterArray(store->AddSetParameter(Number(1), {})); }));
}

void TestTemplateComponentsAreDeduplicated() {
  auto store = MakeStore();

  model::TemplateComponents components;
  components[model::kComponentParameters]["h1"]  = google::protobuf::Struct();
  components[model::kComponentParameters]["h2"]  = google::protobuf::Struct();
  assert(store->AddTemplateComponents(components) == 2);
  assert(store->AddTemplateComponents(components) == 0);
  store->CommitAll();

  components[model::kComponentTaskSchemas]["h3"] = google::protobuf::Struct();
  assert(store->AddTemplateComponents(components) == 1);

  const auto merged = store->GetTemplateComponents();
  assert(merged.at(model::kComponentParameters).size() == 2);
  assert(merged.at(model::kComponentTaskSchemas).size() == 1);
}

void TestWorkflowInfoIsWrittenOnce() {
  auto store = MakeStore();
  assert(Throws<NotFound>([&] { store->GetWorkflowInfo(); }));

  model::WorkflowInfo info;
  info.name                 = "sweep_2026";
  info.creation.app_name    = "jobflow";
  info.creation.app_version = "0.1.0";
  info.creation.create_time = jobflow::util::Now();
  info.creation.ts_fmt      = "%Y-%m-%d %H:%M:%S.%f";
  (*info.workflow_template.mutable_fields())["name"].set_string_value("sweep");
  store->CreateWorkflow(info);

  // not staged: visible to the backend with nothing pending
  assert(!store->HasPending());
  auto tx     = store->Backend().Begin(store->Backend().ResourcesFor(EntityKind::kWorkflow), AccessMode::kRead);
  auto stored = store->Backend().GetWorkflowInfo(*tx);
  tx->Commit();
  assert(stored && stored->name == "sweep_2026");

  store->Reload();
  const auto read = store->GetWorkflowInfo();
  assert(read.creation.app_version == "0.1.0");
  assert(read.creation.create_time == info.creation.create_time);
  assert(read.workflow_template.fields().at("name").string_value() == "sweep");

  info.name = "other";
  assert(Throws<AlreadyExists>([&] { store->CreateWorkflow(info); }));
  assert(store->GetWorkflowInfo().name == "sweep_2026");
}

void TestFileContents() {
  auto store = MakeStore();

  auto literal = store->AddFile(true, "out/result.txt", {}, std::string("hello"));
  assert(store->GetFileContents(literal)->ToString() == "hello");

  const auto path = std::filesystem::temp_directory_path() / "jobflow_persistent_store_input.txt";
  {
    std::ofstream out(path);
    out << "from disk";
  }
  auto copied = store->AddFile(true, path.string(), {});
  auto linked = store->AddFile(false, "/does/not/matter", {});

  store->CommitAll();
  std::filesystem::remove(path);

  assert(store->GetFileContents(literal)->ToString() == "hello");
  assert(store->GetFileContents(copied)->ToString() == "from disk");
  assert(Throws<NotFound>([&] { (void)store->GetFileContents(linked); }));
  assert(Throws<NotFound>([&] { store->AddFile(true, "/no/such/jobflow/file", {}); }));

  const auto unset = store->AddUnsetParameter({});
  store->SetParameterFile(unset, true, "late.txt", std::string("late"));
  assert(store->GetFileContents(unset)->ToString() == "late");
}

void TestSubmissions() {
  auto store = MakeStore();
  auto sub   = store->AddSubmission(std::vector<model::JobscriptRecord>(2));

  model::JobscriptMetadata meta;
  meta.scheduler_job_id = "42";
  store->SetJobscriptMetadata(sub, 1, meta);
  store->AddSubmissionPart(sub, jobflow::util::Now(), {0, 1});
  assert(Throws<NotFound>([&] { store->AddSubmissionPart(sub, jobflow::util::Now(), {2}); }));
  assert(Throws<NotFound>([&] { store->SetJobscriptMetadata(sub, 3, meta); }));

  store->CommitAll();
  store->AddSubmissionPart(sub, jobflow::util::Now(), {1});
  store->CommitAll();

  const auto record = store->GetSubmissions({sub}).front();
  assert(record.submission_parts.size() == 2);
  assert(record.jobscripts[1].metadata.scheduler_job_id == std::string("42"));
}

} // namespace

int main() {
  TestIdsAreAllocatedInCallOrder();
  TestReadYourWrites();
  TestUnknownIdsAreRejected();
  TestIterationRequiresSchemaParameters();
  TestParameterCannotBeSetTwice();
  TestUpdatesOnPendingEntitiesAreFoldedIn();
  TestTaskElementsView();
  TestSaveAndBatchScopes();
  TestFailedGroupKeepsItsBuckets();
  TestLoopUpdatesKeepCallOrder();
  TestLoopIndexUpdatesMerge();
  TestDownstreamTaskCannotConsumeIterableParameter();
  TestDataIndexMustReferenceKnownParameters();
  TestArrayParameters();
  TestTemplateComponentsAreDeduplicated();
  TestWorkflowInfoIsWrittenOnce();
  TestFileContents();
  TestSubmissions();

  std::cout << "jobflow_unit_persistent_store: pass\n";
  return 0;
}
