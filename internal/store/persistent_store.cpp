#include "internal/store/persistent_store.hpp"

#include <filesystem>
#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/array_codec.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace jobflow::store {

using db::AccessMode;
using db::CommitStep;
using db::EntityKind;
namespace model = db::model;
using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(std::string(db::ErrorCodeName(result.code)) + ": " + message);
  }
}

template <typename Record>
Record Loaded(std::optional<Record> record, EntityKind kind, uint64_t id) {
  if (!record) throw util::NotFound(util::MissingEntity(db::EntityKindName(kind), id));
  return std::move(*record);
}

template <typename V>
uint64_t KeyOf(const std::pair<const uint64_t, V>& entry) {
  return entry.first;
}

inline uint64_t KeyOf(uint64_t id) {
  return id;
}

/*
  Applies and erases every update whose target is durable. Updates aimed at
  an entity still in a creation bucket stay put; they are folded in when
  that entity is created.
*/
template <typename Bucket, typename Creating, typename Apply>
void DrainUpdates(Bucket& bucket, const Creating& creating, Apply apply) {
  for (auto it = bucket.begin(); it != bucket.end();) {
    if (creating.contains(KeyOf(*it))) {
      ++it;
      continue;
    }
    apply(*it);
    it = bucket.erase(it);
  }
}

std::vector<uint64_t> Range(uint64_t n) {
  std::vector<uint64_t> ids(n);
  for (uint64_t i = 0; i < n; ++i) ids[i] = i;
  return ids;
}

std::string StepNames(const std::vector<CommitStep>& steps) {
  std::string out;
  for (auto step : steps) {
    if (!out.empty()) out += ",";
    out += db::CommitStepName(step);
  }
  return out;
}

} // namespace

PersistentStore::PersistentStore(std::shared_ptr<db::Repository> repository, storage::ContentStorePtr content, StoreOptions options)
    : PersistentStore(repository, std::move(content), CommitResourceMap::ForRepository(*repository), options) {
}

PersistentStore::PersistentStore(std::shared_ptr<db::Repository> repository, storage::ContentStorePtr content, CommitResourceMap resource_map,
                                 StoreOptions options)
    : repository_(std::move(repository)),
      content_(std::move(content)),
      resource_map_(std::move(resource_map)),
      options_(options),
      use_cache_(options.use_cache) {
  if (!repository_) throw std::invalid_argument("store requires a repository");
  if (!content_) throw std::invalid_argument("store requires a content store");

  JOBFLOW_LOG_INFO("store opened", {StringField("backend", repository_->BackendName()),
                                    IntField("commit_groups", static_cast<int64_t>(resource_map_.Groups().size())),
                                    observability::BoolField("use_cache", use_cache_)});
}

// ------------------------------------------------------------------
// Counts and lookups
// ------------------------------------------------------------------

std::unique_ptr<db::Transaction> PersistentStore::BeginRead(EntityKind kind) {
  return repository_->Begin(repository_->ResourcesFor(kind), AccessMode::kRead);
}

uint64_t PersistentStore::DurableCount(EntityKind kind) {
  CountSlot slot;
  switch (kind) {
    case EntityKind::kTask:
      slot = kTaskCount;
      break;
    case EntityKind::kElement:
      slot = kElementCount;
      break;
    case EntityKind::kIteration:
      slot = kIterationCount;
      break;
    case EntityKind::kRun:
      slot = kRunCount;
      break;
    case EntityKind::kParameter:
      slot = kParameterCount;
      break;
    case EntityKind::kLoop:
      slot = kLoopCount;
      break;
    case EntityKind::kSubmission:
      slot = kSubmissionCount;
      break;
    default:
      throw std::invalid_argument(std::string("entity kind is not counted: ") + db::EntityKindName(kind));
  }

  if (durable_counts_[slot]) return *durable_counts_[slot];

  auto     tx    = BeginRead(kind);
  uint64_t count = 0;
  switch (slot) {
    case kTaskCount:
      count = repository_->CountTasks(*tx);
      break;
    case kElementCount:
      count = repository_->CountElements(*tx);
      break;
    case kIterationCount:
      count = repository_->CountIterations(*tx);
      break;
    case kRunCount:
      count = repository_->CountRuns(*tx);
      break;
    case kParameterCount:
      count = repository_->CountParameters(*tx);
      break;
    case kLoopCount:
      count = repository_->CountLoops(*tx);
      break;
    case kSubmissionCount:
    case kNumCountSlots:
      count = repository_->CountSubmissions(*tx);
      break;
  }
  tx->Commit();

  durable_counts_[slot] = count;
  return count;
}

void PersistentStore::InvalidateKind(EntityKind kind) {
  switch (kind) {
    case EntityKind::kTask:
      task_cache_.Clear();
      durable_counts_[kTaskCount].reset();
      break;
    case EntityKind::kElement:
      element_cache_.Clear();
      durable_counts_[kElementCount].reset();
      break;
    case EntityKind::kIteration:
      iteration_cache_.Clear();
      durable_counts_[kIterationCount].reset();
      break;
    case EntityKind::kRun:
      run_cache_.Clear();
      durable_counts_[kRunCount].reset();
      break;
    case EntityKind::kParameter:
      parameter_cache_.Clear();
      durable_counts_[kParameterCount].reset();
      break;
    case EntityKind::kLoop:
      loop_cache_.Clear();
      durable_counts_[kLoopCount].reset();
      break;
    case EntityKind::kSubmission:
      submission_cache_.Clear();
      durable_counts_[kSubmissionCount].reset();
      break;
    case EntityKind::kTemplateComponents:
      break;
    case EntityKind::kWorkflow:
      workflow_info_.reset();
      break;
  }
}

uint64_t PersistentStore::NumTasks() {
  return DurableCount(EntityKind::kTask) + pending_.add_tasks.size();
}

uint64_t PersistentStore::NumElements() {
  return DurableCount(EntityKind::kElement) + pending_.add_elements.size();
}

uint64_t PersistentStore::NumIterations() {
  return DurableCount(EntityKind::kIteration) + pending_.add_iterations.size();
}

uint64_t PersistentStore::NumRuns() {
  return DurableCount(EntityKind::kRun) + pending_.add_runs.size();
}

uint64_t PersistentStore::NumParameters() {
  return DurableCount(EntityKind::kParameter) + pending_.add_parameters.size();
}

uint64_t PersistentStore::NumLoops() {
  return DurableCount(EntityKind::kLoop) + pending_.add_loops.size();
}

uint64_t PersistentStore::NumSubmissions() {
  return DurableCount(EntityKind::kSubmission) + pending_.add_submissions.size();
}

void PersistentStore::RequireTask(uint64_t id) {
  if (id >= NumTasks()) throw util::NotFound(util::MissingEntity("task", id));
}

void PersistentStore::RequireElement(uint64_t id) {
  if (id >= NumElements()) throw util::NotFound(util::MissingEntity("element", id));
}

void PersistentStore::RequireIteration(uint64_t id) {
  if (id >= NumIterations()) throw util::NotFound(util::MissingEntity("iteration", id));
}

void PersistentStore::RequireRun(uint64_t id) {
  if (id >= NumRuns()) throw util::NotFound(util::MissingEntity("run", id));
}

void PersistentStore::RequireParameter(uint64_t id) {
  if (id >= NumParameters()) throw util::NotFound(util::MissingEntity("parameter", id));
}

void PersistentStore::RequireParameters(const model::DataIndex& data_idx) {
  const auto num_parameters = NumParameters();
  for (auto id : model::ReferencedParameterIds(data_idx)) {
    if (id >= num_parameters) throw util::NotFound(util::MissingEntity("parameter", id));
  }
}

void PersistentStore::RequireLoop(uint64_t id) {
  if (id >= NumLoops()) throw util::NotFound(util::MissingEntity("loop", id));
}

void PersistentStore::RequireSubmission(uint64_t id) {
  if (id >= NumSubmissions()) throw util::NotFound(util::MissingEntity("submission", id));
}

// ------------------------------------------------------------------
// Merged reads
// ------------------------------------------------------------------

template <typename Record, typename Getter>
std::vector<Record> PersistentStore::ReadMerged(EntityKind kind, const std::map<uint64_t, Record>& staged, RecordCache<Record>& cache,
                                                const std::vector<uint64_t>& ids, Getter get) {
  const bool                 caching = CacheEnabled();
  std::map<uint64_t, Record> durable;
  std::vector<uint64_t>      missing;

  for (auto id : ids) {
    if (staged.contains(id) || durable.contains(id)) continue;
    if (caching) {
      if (auto hit = cache.Get(id)) {
        durable.emplace(id, std::move(*hit));
        continue;
      }
    }
    missing.push_back(id);
  }

  if (!missing.empty()) {
    auto tx = BeginRead(kind);
    for (auto id : missing) {
      if (durable.contains(id)) continue;
      auto record = Loaded(get(*tx, id), kind, id);
      if (caching) cache.Put(record);
      durable.emplace(id, std::move(record));
    }
    tx->Commit();
  }

  std::vector<Record> out;
  out.reserve(ids.size());
  for (auto id : ids) {
    auto pending = staged.find(id);
    out.push_back(pending_.Overlay(pending != staged.end() ? pending->second : durable.at(id)));
  }
  return out;
}

std::vector<model::TaskRecord> PersistentStore::GetTasks(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kTask, pending_.add_tasks, task_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetTask(tx, id); });
}

std::vector<model::ElementRecord> PersistentStore::GetElements(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kElement, pending_.add_elements, element_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetElement(tx, id); });
}

std::vector<model::IterationRecord> PersistentStore::GetIterations(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kIteration, pending_.add_iterations, iteration_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetIteration(tx, id); });
}

std::vector<model::RunRecord> PersistentStore::GetRuns(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kRun, pending_.add_runs, run_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetRun(tx, id); });
}

std::vector<model::ParameterRecord> PersistentStore::GetParameters(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kParameter, pending_.add_parameters, parameter_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetParameter(tx, id); });
}

std::vector<model::LoopRecord> PersistentStore::GetLoops(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kLoop, pending_.add_loops, loop_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetLoop(tx, id); });
}

std::vector<model::SubmissionRecord> PersistentStore::GetSubmissions(const std::vector<uint64_t>& ids) {
  return ReadMerged(EntityKind::kSubmission, pending_.add_submissions, submission_cache_, ids,
                    [this](db::Transaction& tx, uint64_t id) { return repository_->GetSubmission(tx, id); });
}

std::vector<model::TaskRecord> PersistentStore::GetAllTasks() {
  return GetTasks(Range(NumTasks()));
}

std::vector<model::ElementRecord> PersistentStore::GetAllElements() {
  return GetElements(Range(NumElements()));
}

std::vector<model::IterationRecord> PersistentStore::GetAllIterations() {
  return GetIterations(Range(NumIterations()));
}

std::vector<model::RunRecord> PersistentStore::GetAllRuns() {
  return GetRuns(Range(NumRuns()));
}

std::vector<model::ParameterRecord> PersistentStore::GetAllParameters() {
  return GetParameters(Range(NumParameters()));
}

std::vector<model::LoopRecord> PersistentStore::GetAllLoops() {
  return GetLoops(Range(NumLoops()));
}

std::vector<model::SubmissionRecord> PersistentStore::GetAllSubmissions() {
  return GetSubmissions(Range(NumSubmissions()));
}

model::TaskRecord PersistentStore::MergedTask(uint64_t id) {
  RequireTask(id);
  return GetTasks({id}).front();
}

model::ElementRecord PersistentStore::MergedElement(uint64_t id) {
  RequireElement(id);
  return GetElements({id}).front();
}

model::IterationRecord PersistentStore::MergedIteration(uint64_t id) {
  RequireIteration(id);
  return GetIterations({id}).front();
}

model::RunRecord PersistentStore::MergedRun(uint64_t id) {
  RequireRun(id);
  return GetRuns({id}).front();
}

model::ParameterRecord PersistentStore::MergedParameter(uint64_t id) {
  RequireParameter(id);
  return GetParameters({id}).front();
}

model::LoopRecord PersistentStore::MergedLoop(uint64_t id) {
  RequireLoop(id);
  return GetLoops({id}).front();
}

model::SubmissionRecord PersistentStore::MergedSubmission(uint64_t id) {
  RequireSubmission(id);
  return GetSubmissions({id}).front();
}

std::vector<bool> PersistentStore::GetParameterSetStatuses(const std::vector<uint64_t>& ids) {
  std::vector<bool> out;
  out.reserve(ids.size());
  for (const auto& p : GetParameters(ids)) out.push_back(p.is_set);
  return out;
}

std::vector<model::ParamSource> PersistentStore::GetParameterSources(const std::vector<uint64_t>& ids) {
  std::vector<model::ParamSource> out;
  out.reserve(ids.size());
  for (auto& p : GetParameters(ids)) out.push_back(std::move(p.source));
  return out;
}

std::vector<bool> PersistentStore::CheckParametersExist(const std::vector<uint64_t>& ids) {
  const auto        n = NumParameters();
  std::vector<bool> out;
  out.reserve(ids.size());
  for (auto id : ids) out.push_back(id < n);
  return out;
}

std::vector<ElementView> PersistentStore::GetTaskElements(uint64_t task_id, const std::vector<uint64_t>& element_indices) {
  const auto task = MergedTask(task_id);

  std::vector<uint64_t> element_ids;
  if (element_indices.empty()) {
    element_ids = task.element_ids;
  } else {
    for (auto idx : element_indices) {
      if (idx >= task.element_ids.size()) {
        throw util::NotFound("task " + std::to_string(task_id) + " has no element at index " + std::to_string(idx));
      }
      element_ids.push_back(task.element_ids[idx]);
    }
  }

  auto elements = GetElements(element_ids);

  std::vector<uint64_t> iteration_ids;
  for (const auto& e : elements) iteration_ids.insert(iteration_ids.end(), e.iteration_ids.begin(), e.iteration_ids.end());
  auto iterations = GetIterations(iteration_ids);

  std::vector<uint64_t> run_ids;
  for (const auto& it : iterations) {
    for (const auto& [action_idx, ids] : it.run_ids) run_ids.insert(run_ids.end(), ids.begin(), ids.end());
  }
  auto runs = GetRuns(run_ids);

  std::map<uint64_t, const model::RunRecord*> run_by_id;
  for (const auto& r : runs) run_by_id[r.id] = &r;
  std::map<uint64_t, const model::IterationRecord*> iteration_by_id;
  for (const auto& it : iterations) iteration_by_id[it.id] = &it;

  std::vector<ElementView> out;
  out.reserve(elements.size());
  for (auto& e : elements) {
    ElementView view;
    for (auto iter_id : e.iteration_ids) {
      IterationView iter_view;
      iter_view.iteration = *iteration_by_id.at(iter_id);
      for (const auto& [action_idx, ids] : iter_view.iteration.run_ids) {
        auto& runs_for_action = iter_view.runs[action_idx];
        for (auto run_id : ids) runs_for_action.push_back(*run_by_id.at(run_id));
      }
      view.iterations.push_back(std::move(iter_view));
    }
    view.element = std::move(e);
    out.push_back(std::move(view));
  }
  return out;
}

model::TemplateComponents PersistentStore::GetTemplateComponents() {
  auto tx         = BeginRead(EntityKind::kTemplateComponents);
  auto components = repository_->GetTemplateComponents(*tx);
  tx->Commit();
  model::MergeComponents(components, pending_.add_template_components);
  return components;
}

model::WorkflowInfo PersistentStore::GetWorkflowInfo() {
  if (!workflow_info_) {
    auto tx   = BeginRead(EntityKind::kWorkflow);
    auto info = repository_->GetWorkflowInfo(*tx);
    tx->Commit();
    if (!info) throw util::NotFound("workflow metadata has not been created");
    workflow_info_ = std::move(info);
  }
  return *workflow_info_;
}

std::shared_ptr<arrow::Buffer> PersistentStore::GetFileContents(uint64_t parameter_id) {
  const auto param = MergedParameter(parameter_id);
  if (!param.file || !param.file->store_contents) {
    throw util::NotFound("parameter " + std::to_string(parameter_id) + " has no stored file contents");
  }

  return StagedOrStoredContents(param.file->content_key);
}

std::shared_ptr<arrow::ChunkedArray> PersistentStore::GetParameterArray(uint64_t parameter_id) {
  const auto param = MergedParameter(parameter_id);
  if (!param.array) {
    throw util::NotFound("parameter " + std::to_string(parameter_id) + " holds no array");
  }
  return storage::common::DecodeArray(StagedOrStoredContents(param.array->content_key));
}

std::shared_ptr<arrow::Buffer> PersistentStore::StagedOrStoredContents(const std::string& content_key) {
  if (auto staged = pending_.add_files.find(content_key); staged != pending_.add_files.end()) {
    if (staged->second.contents) return staged->second.contents;
    return storage::common::ReadFile(*staged->second.source_path);
  }
  return content_->Read(content_key);
}

// ------------------------------------------------------------------
// Creation
// ------------------------------------------------------------------

uint64_t PersistentStore::AddTask(uint64_t index, google::protobuf::Struct task_template, const std::set<std::string>& input_types) {
  if (!input_types.empty()) {
    for (const auto& loop : GetAllLoops()) {
      for (const auto& type : input_types) model::ValidateDownstreamInput(loop, index, type);
    }
  }

  model::TaskRecord record;
  record.id            = NumTasks();
  record.index         = index;
  record.task_template = std::move(task_template);

  const auto id = record.id;
  pending_.add_tasks.emplace(id, std::move(record));
  return id;
}

uint64_t PersistentStore::AddElementSet(uint64_t task_id, google::protobuf::Struct element_set) {
  const auto task   = MergedTask(task_id);
  const auto es_idx = static_cast<uint64_t>(task.element_sets.size());
  pending_.add_element_sets[task_id].push_back(std::move(element_set));
  return es_idx;
}

uint64_t PersistentStore::AddElement(uint64_t task_id, uint64_t es_idx, std::map<std::string, int64_t> seq_idx,
                                     std::map<std::string, int64_t> src_idx) {
  const auto task = MergedTask(task_id);

  model::ElementRecord record;
  record.id      = NumElements();
  record.task_id = task_id;
  record.index   = task.element_ids.size();
  record.es_idx  = es_idx;
  record.seq_idx = std::move(seq_idx);
  record.src_idx = std::move(src_idx);

  const auto id = record.id;
  pending_.add_elements.emplace(id, std::move(record));
  pending_.add_element_ids[task_id].push_back(id);
  return id;
}

uint64_t PersistentStore::AddElementIteration(uint64_t element_id, model::DataIndex data_idx, std::vector<std::string> schema_parameters,
                                              model::LoopIndex loop_idx) {
  RequireElement(element_id);
  for (const auto& path : schema_parameters) {
    if (!data_idx.contains(path)) {
      throw util::InvariantViolation("iteration of element " + std::to_string(element_id) + ": data index lacks schema parameter " + path);
    }
  }
  RequireParameters(data_idx);

  model::IterationRecord record;
  record.id                = NumIterations();
  record.element_id        = element_id;
  record.data_idx          = std::move(data_idx);
  record.schema_parameters = std::move(schema_parameters);
  record.loop_idx          = std::move(loop_idx);

  const auto id = record.id;
  pending_.add_iterations.emplace(id, std::move(record));
  pending_.add_iteration_ids[element_id].push_back(id);
  return id;
}

uint64_t PersistentStore::AddRun(uint64_t iteration_id, uint64_t action_idx, std::vector<uint64_t> commands_idx, model::DataIndex data_idx,
                                 google::protobuf::Struct metadata) {
  RequireIteration(iteration_id);
  RequireParameters(data_idx);

  model::RunRecord record;
  record.id           = NumRuns();
  record.iteration_id = iteration_id;
  record.action_idx   = action_idx;
  record.commands_idx = std::move(commands_idx);
  record.data_idx     = std::move(data_idx);
  record.metadata     = std::move(metadata);

  const auto id = record.id;
  pending_.add_runs.emplace(id, std::move(record));
  pending_.add_run_ids[iteration_id][action_idx].push_back(id);
  return id;
}

uint64_t PersistentStore::AddLoop(std::string name, std::vector<uint64_t> task_indices, std::vector<std::string> parents,
                                  model::IterationCounts num_added_iterations, const std::vector<model::TaskParameterTypes>& task_types) {
  model::LoopRecord record;
  record.id                   = NumLoops();
  record.name                 = std::move(name);
  record.task_indices         = std::move(task_indices);
  record.parents              = std::move(parents);
  record.num_added_iterations = std::move(num_added_iterations);
  record.Validate();

  for (const auto& task : task_types) {
    if (task.index < record.task_indices.front() || task.index > record.task_indices.back()) {
      throw util::InvariantViolation("loop " + record.name + ": task " + std::to_string(task.index) + " is outside the loop");
    }
  }
  record.iterable_parameters = model::FindIterableParameters(task_types);

  const auto id = record.id;
  pending_.add_loops.emplace(id, std::move(record));
  return id;
}

uint64_t PersistentStore::AddSubmission(std::vector<model::JobscriptRecord> jobscripts) {
  model::SubmissionRecord record;
  record.id         = NumSubmissions();
  record.jobscripts = std::move(jobscripts);

  const auto id = record.id;
  pending_.add_submissions.emplace(id, std::move(record));
  return id;
}

uint64_t PersistentStore::AddSetParameter(google::protobuf::Value data, model::ParamSource source, std::map<std::string, std::string> type_lookup) {
  model::ParameterRecord record;
  record.id          = NumParameters();
  record.is_set      = true;
  record.data        = std::move(data);
  record.type_lookup = std::move(type_lookup);
  record.source      = std::move(source);

  const auto id = record.id;
  pending_.add_parameters.emplace(id, std::move(record));
  return id;
}

uint64_t PersistentStore::AddUnsetParameter(model::ParamSource source) {
  model::ParameterRecord record;
  record.id     = NumParameters();
  record.source = std::move(source);

  const auto id = record.id;
  pending_.add_parameters.emplace(id, std::move(record));
  return id;
}

model::FileReference PersistentStore::StageFile(uint64_t parameter_id, bool store_contents, std::string path, std::optional<std::string> contents) {
  model::FileReference ref;
  ref.store_contents = store_contents;
  ref.path           = std::move(path);
  if (!store_contents) return ref;

  if (!contents && !std::filesystem::is_regular_file(ref.path)) {
    throw util::NotFound("file " + ref.path + " does not exist");
  }

  ref.content_key = storage::common::ContentKeyFor(parameter_id, ref.path);

  PendingFile file;
  file.content_key = ref.content_key;
  if (contents) {
    file.contents = arrow::Buffer::FromString(std::move(*contents));
  } else {
    file.source_path = ref.path;
  }
  pending_.add_files[ref.content_key] = std::move(file);
  return ref;
}

model::ArrayReference PersistentStore::StageArray(uint64_t parameter_id, const arrow::Array& values, std::vector<int64_t> shape) {
  if (shape.empty()) shape = {values.length()};

  int64_t count = 1;
  for (auto dim : shape) {
    if (dim < 0) throw util::InvariantViolation("array parameter " + std::to_string(parameter_id) + ": negative dimension");
    count *= dim;
  }
  if (count != values.length()) {
    throw util::InvariantViolation("array parameter " + std::to_string(parameter_id) + ": shape holds " + std::to_string(count) + " values, array has " +
                                   std::to_string(values.length()));
  }

  model::ArrayReference ref;
  ref.content_key  = storage::common::ArrayContentKeyFor(parameter_id);
  ref.dtype        = values.type()->ToString();
  ref.shape        = std::move(shape);
  ref.chunk_length = options_.array_chunk_length;

  // encoding throws for non-numeric arrays, before anything is staged
  PendingFile file;
  file.content_key = ref.content_key;
  file.contents    = storage::common::EncodeArray(values, ref.chunk_length);
  pending_.add_files[ref.content_key] = std::move(file);
  return ref;
}

uint64_t PersistentStore::AddArrayParameter(const std::shared_ptr<arrow::Array>& values, model::ParamSource source, std::vector<int64_t> shape) {
  if (!values) throw std::invalid_argument("array parameter requires values");

  model::ParameterRecord record;
  record.id     = NumParameters();
  record.is_set = true;
  record.array  = StageArray(record.id, *values, std::move(shape));
  record.source = std::move(source);

  const auto id = record.id;
  pending_.add_parameters.emplace(id, std::move(record));
  return id;
}

uint64_t PersistentStore::AddFile(bool store_contents, std::string path, model::ParamSource source, std::optional<std::string> contents) {
  model::ParameterRecord record;
  record.id     = NumParameters();
  record.is_set = true;
  record.file   = StageFile(record.id, store_contents, std::move(path), std::move(contents));
  record.source = std::move(source);

  const auto id = record.id;
  pending_.add_parameters.emplace(id, std::move(record));
  return id;
}

void PersistentStore::CreateWorkflow(const model::WorkflowInfo& info) {
  auto tx = repository_->Begin(repository_->ResourcesFor(EntityKind::kWorkflow), AccessMode::kWrite);
  ThrowIfDbError(repository_->InsertWorkflowInfo(*tx, info), "create workflow " + info.name);
  tx->Commit();
  workflow_info_ = info;

  JOBFLOW_LOG_INFO("workflow created", {StringField("name", info.name), StringField("app", info.creation.app_name)});
}

size_t PersistentStore::AddTemplateComponents(const model::TemplateComponents& components) {
  const auto known = GetTemplateComponents();

  model::TemplateComponents added;
  size_t                    n = 0;
  for (const auto& [type, by_hash] : components) {
    auto existing = known.find(type);
    for (const auto& [hash, doc] : by_hash) {
      if (existing != known.end() && existing->second.contains(hash)) continue;
      if (added[type].try_emplace(hash, doc).second) ++n;
    }
  }
  model::MergeComponents(pending_.add_template_components, added);
  return n;
}

// ------------------------------------------------------------------
// Updates
// ------------------------------------------------------------------

void PersistentStore::SetRunsInitialised(uint64_t iteration_id) {
  RequireIteration(iteration_id);
  pending_.set_runs_initialised.insert(iteration_id);
}

void PersistentStore::UpdateLoopIndex(uint64_t iteration_id, model::LoopIndex loop_idx) {
  RequireIteration(iteration_id);
  auto& staged = pending_.update_loop_indices[iteration_id];
  for (auto& [loop, idx] : loop_idx) staged[loop] = idx;
}

void PersistentStore::AddSubmissionPart(uint64_t submission_id, util::TimePoint submit_time, std::vector<uint64_t> jobscript_indices) {
  const auto submission = MergedSubmission(submission_id);
  for (auto js_idx : jobscript_indices) {
    if (js_idx >= submission.jobscripts.size()) {
      throw util::NotFound("submission " + std::to_string(submission_id) + " has no jobscript " + std::to_string(js_idx));
    }
  }
  pending_.add_submission_parts[submission_id].push_back(model::SubmissionPart{submit_time, std::move(jobscript_indices)});
}

void PersistentStore::SetRunSubmissionIndex(const std::vector<uint64_t>& run_ids, int64_t submission_idx) {
  for (auto id : run_ids) RequireRun(id);
  for (auto id : run_ids) pending_.set_run_submission_idx[id] = submission_idx;
}

void PersistentStore::SetRunSkip(uint64_t run_id) {
  RequireRun(run_id);
  pending_.set_run_skips.insert(run_id);
}

void PersistentStore::SetRunStart(uint64_t run_id, util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, std::string hostname) {
  RequireRun(run_id);
  pending_.set_run_starts[run_id] = RunStart{time, std::move(snapshot), std::move(hostname)};
}

void PersistentStore::SetRunEnd(uint64_t run_id, util::TimePoint time, std::optional<google::protobuf::Struct> snapshot, int32_t exit_code,
                                bool success) {
  RequireRun(run_id);
  pending_.set_run_ends[run_id] = RunEnd{time, std::move(snapshot), exit_code, success};
}

void PersistentStore::SetJobscriptMetadata(uint64_t submission_id, uint64_t js_idx, const model::JobscriptMetadata& metadata) {
  // validates the jobscript index
  MergedSubmission(submission_id).WithJobscriptMetadata(js_idx, metadata);

  auto& staged = pending_.set_jobscript_metadata[submission_id];
  auto  it     = staged.find(js_idx);
  if (it == staged.end()) {
    staged.emplace(js_idx, metadata);
  } else {
    it->second = it->second.MergedWith(metadata);
  }
}

void PersistentStore::SetParameterValue(uint64_t parameter_id, google::protobuf::Value data, std::map<std::string, std::string> type_lookup) {
  // throws InvariantViolation when already set
  MergedParameter(parameter_id).WithValue(data, type_lookup);

  ParameterValueUpdate update;
  update.value       = std::move(data);
  update.type_lookup = std::move(type_lookup);
  pending_.set_parameters[parameter_id] = std::move(update);
}

void PersistentStore::SetParameterFile(uint64_t parameter_id, bool store_contents, std::string path, std::optional<std::string> contents) {
  MergedParameter(parameter_id).WithFile(model::FileReference{});

  ParameterValueUpdate update;
  update.file                           = StageFile(parameter_id, store_contents, std::move(path), std::move(contents));
  pending_.set_parameters[parameter_id] = std::move(update);
}

void PersistentStore::SetParameterArray(uint64_t parameter_id, const std::shared_ptr<arrow::Array>& values, std::vector<int64_t> shape) {
  if (!values) throw std::invalid_argument("array parameter requires values");
  MergedParameter(parameter_id).WithArray(model::ArrayReference{});

  ParameterValueUpdate update;
  update.array                          = StageArray(parameter_id, *values, std::move(shape));
  pending_.set_parameters[parameter_id] = std::move(update);
}

void PersistentStore::UpdateParameterSource(uint64_t parameter_id, const model::ParamSource& source) {
  RequireParameter(parameter_id);
  auto& staged = pending_.update_param_sources[parameter_id];
  staged       = model::MergeSource(staged, source);
}

void PersistentStore::UpdateLoopNumIterations(uint64_t loop_id, std::vector<int64_t> parent_idx, int64_t num_iterations) {
  MergedLoop(loop_id).WithNumIterations(parent_idx, num_iterations);

  // a pending parents update replaces the whole count map, so later counts
  // belong inside it
  if (auto parents = pending_.update_loop_parents.find(loop_id); parents != pending_.update_loop_parents.end()) {
    parents->second.counts[parent_idx] = num_iterations;
    return;
  }
  pending_.update_loop_num_iterations[loop_id][std::move(parent_idx)] = num_iterations;
}

void PersistentStore::UpdateLoopParents(uint64_t loop_id, std::vector<std::string> parents, model::IterationCounts counts) {
  MergedLoop(loop_id).WithParents(parents, counts);

  pending_.update_loop_num_iterations.erase(loop_id);
  pending_.update_loop_parents[loop_id] = LoopParentsUpdate{std::move(parents), std::move(counts)};
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

void PersistentStore::Save() {
  if (batch_depth_ > 0) {
    return;
  }
  if (pending_.IsEmpty()) {
    return;
  }
  CommitAll();
}

void PersistentStore::SetUseCache(bool enabled) {
  use_cache_ = enabled;
  if (!CacheEnabled()) Reload();
}

void PersistentStore::Reload() {
  task_cache_.Clear();
  element_cache_.Clear();
  iteration_cache_.Clear();
  run_cache_.Clear();
  parameter_cache_.Clear();
  loop_cache_.Clear();
  submission_cache_.Clear();
  for (auto& count : durable_counts_) count.reset();
  workflow_info_.reset();
}

void PersistentStore::CommitAll() {
  if (pending_.IsEmpty()) {
    JOBFLOW_LOG_DEBUG("commit: no pending changes");
    return;
  }

  observability::SpanScope span("store.commit_all");
  JOBFLOW_LOG_INFO("committing pending changes", {StringField("pending", pending_.Describe())});

  std::optional<util::CommitFailure> first_failure;

  for (const auto& group : resource_map_.Groups()) {
    std::vector<CommitStep> steps;
    size_t                  entries = 0;
    for (auto step : group.steps) {
      if (!pending_.HasWork(step)) continue;
      steps.push_back(step);
      entries += pending_.EntryCount(step);
    }
    if (steps.empty()) continue;

    const auto resources  = JoinResources(group.resources);
    const auto step_names = StepNames(steps);

    observability::SpanScope group_span("store.commit_group", {StringField("resources", resources), StringField("steps", step_names),
                                                               IntField("entries", static_cast<int64_t>(entries))});

    const PendingChanges snapshot = pending_;
    CommitStep           current  = steps.front();

    try {
      auto tx = repository_->Begin(group.resources, AccessMode::kWrite);
      for (auto step : steps) {
        current = step;
        RunStep(step, *tx);
      }
      tx->Commit();
    } catch (const std::exception& e) {
      // the transaction was discarded on unwind; put the buckets back
      pending_ = snapshot;
      Reload();

      group_span.RecordException(e.what());
      JOBFLOW_LOG_ERROR("commit group failed", {StringField("resources", resources), StringField("step", db::CommitStepName(current)),
                                                StringField("error", e.what())});
      if (!first_failure) first_failure.emplace(resources, db::CommitStepName(current), e.what());
      continue;
    }

    for (auto step : steps) {
      for (auto kind : db::KindsWrittenBy(step)) InvalidateKind(kind);
    }
    JOBFLOW_LOG_INFO("commit group applied",
                     {StringField("resources", resources), StringField("steps", step_names), IntField("entries", static_cast<int64_t>(entries))});
  }

  if (first_failure) throw *first_failure;
}

// ------------------------------------------------------------------
// Commit steps
// ------------------------------------------------------------------

void PersistentStore::RunStep(CommitStep step, db::Transaction& tx) {
  switch (step) {
    case CommitStep::kTasks:
      return CommitTasks(tx);
    case CommitStep::kLoops:
      return CommitLoops(tx);
    case CommitStep::kSubmissions:
      return CommitSubmissions(tx);
    case CommitStep::kSubmissionParts:
      return CommitSubmissionParts(tx);
    case CommitStep::kElementIds:
      return CommitElementIds(tx);
    case CommitStep::kElements:
      return CommitElements(tx);
    case CommitStep::kElementSets:
      return CommitElementSets(tx);
    case CommitStep::kIterationIds:
      return CommitIterationIds(tx);
    case CommitStep::kIterations:
      return CommitIterations(tx);
    case CommitStep::kRunIds:
      return CommitRunIds(tx);
    case CommitStep::kRunsInitialised:
      return CommitRunsInitialised(tx);
    case CommitStep::kRuns:
      return CommitRuns(tx);
    case CommitStep::kRunSubmissionIndices:
      return CommitRunSubmissionIndices(tx);
    case CommitStep::kRunSkips:
      return CommitRunSkips(tx);
    case CommitStep::kRunStarts:
      return CommitRunStarts(tx);
    case CommitStep::kRunEnds:
      return CommitRunEnds(tx);
    case CommitStep::kJobscriptMetadata:
      return CommitJobscriptMetadata(tx);
    case CommitStep::kParameters:
      return CommitParameters(tx);
    case CommitStep::kFiles:
      return CommitFiles();
    case CommitStep::kTemplateComponents:
      return CommitTemplateComponents(tx);
    case CommitStep::kParameterSources:
      return CommitParameterSources(tx);
    case CommitStep::kLoopIndices:
      return CommitLoopIndices(tx);
    case CommitStep::kLoopNumIterations:
      return CommitLoopNumIterations(tx);
    case CommitStep::kLoopParents:
      return CommitLoopParents(tx);
  }
}

void PersistentStore::CommitTasks(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_tasks) {
    ThrowIfDbError(repository_->InsertTask(tx, pending_.Overlay(staged)), "insert task " + std::to_string(id));
    pending_.PruneTask(id);
  }
  pending_.add_tasks.clear();
}

void PersistentStore::CommitLoops(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_loops) {
    ThrowIfDbError(repository_->InsertLoop(tx, pending_.Overlay(staged)), "insert loop " + std::to_string(id));
    pending_.PruneLoop(id);
  }
  pending_.add_loops.clear();
}

void PersistentStore::CommitSubmissions(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_submissions) {
    ThrowIfDbError(repository_->InsertSubmission(tx, pending_.Overlay(staged)), "insert submission " + std::to_string(id));
    pending_.PruneSubmission(id);
  }
  pending_.add_submissions.clear();
}

void PersistentStore::CommitSubmissionParts(db::Transaction& tx) {
  DrainUpdates(pending_.add_submission_parts, pending_.add_submissions, [&](const auto& entry) {
    auto submission = Loaded(repository_->GetSubmission(tx, entry.first), EntityKind::kSubmission, entry.first);
    ThrowIfDbError(repository_->UpdateSubmission(tx, submission.WithParts(entry.second)), "append submission parts");
  });
}

void PersistentStore::CommitElementIds(db::Transaction& tx) {
  DrainUpdates(pending_.add_element_ids, pending_.add_tasks, [&](const auto& entry) {
    auto task = Loaded(repository_->GetTask(tx, entry.first), EntityKind::kTask, entry.first);
    ThrowIfDbError(repository_->UpdateTask(tx, task.WithElementIds(entry.second)), "append element ids");
  });
}

void PersistentStore::CommitElements(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_elements) {
    ThrowIfDbError(repository_->InsertElement(tx, pending_.Overlay(staged)), "insert element " + std::to_string(id));
    pending_.PruneElement(id);
  }
  pending_.add_elements.clear();
}

void PersistentStore::CommitElementSets(db::Transaction& tx) {
  DrainUpdates(pending_.add_element_sets, pending_.add_tasks, [&](const auto& entry) {
    auto task = Loaded(repository_->GetTask(tx, entry.first), EntityKind::kTask, entry.first);
    ThrowIfDbError(repository_->UpdateTask(tx, task.WithElementSets(entry.second)), "append element sets");
  });
}

void PersistentStore::CommitIterationIds(db::Transaction& tx) {
  DrainUpdates(pending_.add_iteration_ids, pending_.add_elements, [&](const auto& entry) {
    auto element = Loaded(repository_->GetElement(tx, entry.first), EntityKind::kElement, entry.first);
    ThrowIfDbError(repository_->UpdateElement(tx, element.WithIterationIds(entry.second)), "append iteration ids");
  });
}

void PersistentStore::CommitIterations(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_iterations) {
    ThrowIfDbError(repository_->InsertIteration(tx, pending_.Overlay(staged)), "insert iteration " + std::to_string(id));
    pending_.PruneIteration(id);
  }
  pending_.add_iterations.clear();
}

void PersistentStore::CommitRunIds(db::Transaction& tx) {
  DrainUpdates(pending_.add_run_ids, pending_.add_iterations, [&](const auto& entry) {
    auto iteration = Loaded(repository_->GetIteration(tx, entry.first), EntityKind::kIteration, entry.first);
    for (const auto& [action_idx, ids] : entry.second) iteration = iteration.WithRunIds(action_idx, ids);
    ThrowIfDbError(repository_->UpdateIteration(tx, iteration), "append run ids");
  });
}

void PersistentStore::CommitRunsInitialised(db::Transaction& tx) {
  DrainUpdates(pending_.set_runs_initialised, pending_.add_iterations, [&](uint64_t id) {
    auto iteration = Loaded(repository_->GetIteration(tx, id), EntityKind::kIteration, id);
    ThrowIfDbError(repository_->UpdateIteration(tx, iteration.WithRunsInitialised()), "set runs initialised");
  });
}

void PersistentStore::CommitRuns(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_runs) {
    ThrowIfDbError(repository_->InsertRun(tx, pending_.Overlay(staged)), "insert run " + std::to_string(id));
    pending_.PruneRun(id);
  }
  pending_.add_runs.clear();
}

void PersistentStore::CommitRunSubmissionIndices(db::Transaction& tx) {
  DrainUpdates(pending_.set_run_submission_idx, pending_.add_runs, [&](const auto& entry) {
    auto run = Loaded(repository_->GetRun(tx, entry.first), EntityKind::kRun, entry.first);
    ThrowIfDbError(repository_->UpdateRun(tx, run.WithSubmissionIdx(entry.second)), "set run submission index");
  });
}

void PersistentStore::CommitRunSkips(db::Transaction& tx) {
  DrainUpdates(pending_.set_run_skips, pending_.add_runs, [&](uint64_t id) {
    auto run = Loaded(repository_->GetRun(tx, id), EntityKind::kRun, id);
    ThrowIfDbError(repository_->UpdateRun(tx, run.WithSkip()), "set run skip");
  });
}

void PersistentStore::CommitRunStarts(db::Transaction& tx) {
  DrainUpdates(pending_.set_run_starts, pending_.add_runs, [&](const auto& entry) {
    auto        run   = Loaded(repository_->GetRun(tx, entry.first), EntityKind::kRun, entry.first);
    const auto& start = entry.second;
    ThrowIfDbError(repository_->UpdateRun(tx, run.WithStart(start.time, start.snapshot, start.hostname)), "set run start");
  });
}

void PersistentStore::CommitRunEnds(db::Transaction& tx) {
  DrainUpdates(pending_.set_run_ends, pending_.add_runs, [&](const auto& entry) {
    auto        run = Loaded(repository_->GetRun(tx, entry.first), EntityKind::kRun, entry.first);
    const auto& end = entry.second;
    ThrowIfDbError(repository_->UpdateRun(tx, run.WithEnd(end.time, end.snapshot, end.exit_code, end.success)), "set run end");
  });
}

void PersistentStore::CommitJobscriptMetadata(db::Transaction& tx) {
  DrainUpdates(pending_.set_jobscript_metadata, pending_.add_submissions, [&](const auto& entry) {
    auto submission = Loaded(repository_->GetSubmission(tx, entry.first), EntityKind::kSubmission, entry.first);
    for (const auto& [js_idx, update] : entry.second) submission = submission.WithJobscriptMetadata(js_idx, update);
    ThrowIfDbError(repository_->UpdateSubmission(tx, submission), "set jobscript metadata");
  });
}

void PersistentStore::CommitParameters(db::Transaction& tx) {
  for (const auto& [id, staged] : pending_.add_parameters) {
    ThrowIfDbError(repository_->InsertParameter(tx, pending_.Overlay(staged)), "insert parameter " + std::to_string(id));
    pending_.PruneParameter(id);
  }
  pending_.add_parameters.clear();

  DrainUpdates(pending_.set_parameters, pending_.add_parameters, [&](const auto& entry) {
    auto        param  = Loaded(repository_->GetParameter(tx, entry.first), EntityKind::kParameter, entry.first);
    const auto& update = entry.second;
    if (update.file) {
      param = param.WithFile(*update.file);
    } else if (update.array) {
      param = param.WithArray(*update.array);
    } else {
      param = param.WithValue(*update.value, update.type_lookup);
    }
    ThrowIfDbError(repository_->UpdateParameter(tx, param), "set parameter value");
  });
}

void PersistentStore::CommitFiles() {
  for (const auto& [key, file] : pending_.add_files) {
    auto buffer = file.contents ? file.contents : storage::common::ReadFile(*file.source_path);
    content_->Write(key, buffer, options_.content_fsync);
  }
  pending_.add_files.clear();
}

void PersistentStore::CommitTemplateComponents(db::Transaction& tx) {
  ThrowIfDbError(repository_->MergeTemplateComponents(tx, pending_.add_template_components), "merge template components");
  pending_.add_template_components.clear();
}

void PersistentStore::CommitParameterSources(db::Transaction& tx) {
  DrainUpdates(pending_.update_param_sources, pending_.add_parameters, [&](const auto& entry) {
    auto param = Loaded(repository_->GetParameter(tx, entry.first), EntityKind::kParameter, entry.first);
    ThrowIfDbError(repository_->UpdateParameter(tx, param.WithSource(entry.second)), "update parameter source");
  });
}

void PersistentStore::CommitLoopIndices(db::Transaction& tx) {
  DrainUpdates(pending_.update_loop_indices, pending_.add_iterations, [&](const auto& entry) {
    auto iteration = Loaded(repository_->GetIteration(tx, entry.first), EntityKind::kIteration, entry.first);
    ThrowIfDbError(repository_->UpdateIteration(tx, iteration.WithLoopIdx(entry.second)), "update loop index");
  });
}

void PersistentStore::CommitLoopNumIterations(db::Transaction& tx) {
  DrainUpdates(pending_.update_loop_num_iterations, pending_.add_loops, [&](const auto& entry) {
    auto loop = Loaded(repository_->GetLoop(tx, entry.first), EntityKind::kLoop, entry.first);
    for (const auto& [parent_idx, num] : entry.second) loop = loop.WithNumIterations(parent_idx, num);
    ThrowIfDbError(repository_->UpdateLoop(tx, loop), "update loop iteration counts");
  });
}

void PersistentStore::CommitLoopParents(db::Transaction& tx) {
  DrainUpdates(pending_.update_loop_parents, pending_.add_loops, [&](const auto& entry) {
    auto loop = Loaded(repository_->GetLoop(tx, entry.first), EntityKind::kLoop, entry.first);
    ThrowIfDbError(repository_->UpdateLoop(tx, loop.WithParents(entry.second.parents, entry.second.counts)), "update loop parents");
  });
}

// ------------------------------------------------------------------
// Scopes
// ------------------------------------------------------------------

PersistentStore::BatchScope::BatchScope(PersistentStore& store) : store_(store) {
  if (store_.batch_depth_++ == 0) JOBFLOW_LOG_DEBUG("batch mode entered");
}

PersistentStore::BatchScope::~BatchScope() {
  if (!open_) return;
  if (--store_.batch_depth_ == 0) {
    JOBFLOW_LOG_DEBUG("batch abandoned", {StringField("pending", store_.pending_.Describe())});
  }
}

void PersistentStore::BatchScope::Commit() {
  if (!open_) return;
  open_ = false;
  if (--store_.batch_depth_ == 0) JOBFLOW_LOG_DEBUG("batch mode left");
  store_.Save();
}

PersistentStore::CacheScope::CacheScope(PersistentStore& store) : store_(store) {
  ++store_.cache_depth_;
}

PersistentStore::CacheScope::~CacheScope() {
  --store_.cache_depth_;
  if (!store_.CacheEnabled()) store_.Reload();
}

} // namespace jobflow::store
