#include "json_repository.hpp"

#include <string>

#include "internal/db/model/record_codec.hpp"
#include "json_document.hpp"
#include "json_tx.hpp"

namespace jobflow::db::json {

namespace {

template <typename Record, typename Message>
Result InsertDense(google::protobuf::RepeatedPtrField<Message>* rows, const Record& r, EntityKind kind) {
  const auto size = static_cast<uint64_t>(rows->size());
  if (r.id < size) {
    return Result::Err(ErrorCode::AlreadyExists, std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " already exists");
  }
  if (r.id > size) {
    return Result::Err(ErrorCode::Conflict,
                       std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " would leave a gap after " + std::to_string(size));
  }
  *rows->Add() = model::Encode(r);
  return Result::Ok();
}

template <typename Record, typename Message>
Result UpdateDense(google::protobuf::RepeatedPtrField<Message>* rows, const Record& r, EntityKind kind) {
  if (r.id >= static_cast<uint64_t>(rows->size())) {
    return Result::Err(ErrorCode::NotFound, std::string(EntityKindName(kind)) + " " + std::to_string(r.id));
  }
  *rows->Mutable(static_cast<int>(r.id)) = model::Encode(r);
  return Result::Ok();
}

template <typename Message>
auto GetDense(const google::protobuf::RepeatedPtrField<Message>& rows, uint64_t id) -> std::optional<decltype(model::Decode(rows.Get(0)))> {
  if (id >= static_cast<uint64_t>(rows.size())) return std::nullopt;
  return model::Decode(rows.Get(static_cast<int>(id)));
}

template <typename Document>
std::shared_ptr<const Document> LoadOrEmpty(const std::filesystem::path& path) {
  auto doc = std::make_shared<Document>();
  LoadDocument(path, doc.get());
  return doc;
}

} // namespace

JsonRepository::JsonRepository(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path JsonRepository::PathOf(const std::string& resource) const {
  return root_ / (resource + ".json");
}

std::vector<std::string> JsonRepository::ResourcesFor(EntityKind kind) const {
  switch (kind) {
    case EntityKind::kParameter:
      return {kParametersResource};
    case EntityKind::kSubmission:
      return {kSubmissionsResource};
    case EntityKind::kTask:
    case EntityKind::kElement:
    case EntityKind::kIteration:
    case EntityKind::kRun:
    case EntityKind::kLoop:
    case EntityKind::kTemplateComponents:
    case EntityKind::kWorkflow:
      return {kMetadataResource};
  }
  return {kMetadataResource};
}

std::unique_ptr<db::Transaction> JsonRepository::Begin(const std::vector<std::string>& resources, AccessMode mode) {
  return std::make_unique<JsonTransaction>(*this, resources, mode);
}

JsonRepository::Documents JsonRepository::Snapshot() {
  std::scoped_lock lock(mutex_);
  if (!committed_.metadata) committed_.metadata = LoadOrEmpty<v1::MetadataDocument>(PathOf(kMetadataResource));
  if (!committed_.parameters) committed_.parameters = LoadOrEmpty<v1::ParametersDocument>(PathOf(kParametersResource));
  if (!committed_.submissions) committed_.submissions = LoadOrEmpty<v1::SubmissionsDocument>(PathOf(kSubmissionsResource));
  return committed_;
}

void JsonRepository::Publish(const Documents& changed) {
  std::scoped_lock lock(mutex_);
  if (changed.metadata) committed_.metadata = changed.metadata;
  if (changed.parameters) committed_.parameters = changed.parameters;
  if (changed.submissions) committed_.submissions = changed.submissions;
}

static JsonTransaction& TX(db::Transaction& tx) {
  return static_cast<JsonTransaction&>(tx);
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

Result JsonRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto& doc    = TX(t).MutableMetadata();
  auto  result = InsertDense(doc.mutable_tasks(), r, EntityKind::kTask);
  if (result) doc.set_num_added_tasks(static_cast<uint64_t>(doc.tasks_size()));
  return result;
}

Result JsonRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  return UpdateDense(TX(t).MutableMetadata().mutable_tasks(), r, EntityKind::kTask);
}

std::optional<model::TaskRecord> JsonRepository::GetTask(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Metadata().tasks(), id);
}

uint64_t JsonRepository::CountTasks(Transaction& t) {
  return TX(t).Metadata().num_added_tasks();
}

// ------------------------------------------------------------
// Elements
// ------------------------------------------------------------

Result JsonRepository::InsertElement(Transaction& t, const model::ElementRecord& r) {
  return InsertDense(TX(t).MutableMetadata().mutable_elements(), r, EntityKind::kElement);
}

Result JsonRepository::UpdateElement(Transaction& t, const model::ElementRecord& r) {
  return UpdateDense(TX(t).MutableMetadata().mutable_elements(), r, EntityKind::kElement);
}

std::optional<model::ElementRecord> JsonRepository::GetElement(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Metadata().elements(), id);
}

uint64_t JsonRepository::CountElements(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Metadata().elements_size());
}

// ------------------------------------------------------------
// Iterations
// ------------------------------------------------------------

Result JsonRepository::InsertIteration(Transaction& t, const model::IterationRecord& r) {
  return InsertDense(TX(t).MutableMetadata().mutable_iterations(), r, EntityKind::kIteration);
}

Result JsonRepository::UpdateIteration(Transaction& t, const model::IterationRecord& r) {
  return UpdateDense(TX(t).MutableMetadata().mutable_iterations(), r, EntityKind::kIteration);
}

std::optional<model::IterationRecord> JsonRepository::GetIteration(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Metadata().iterations(), id);
}

uint64_t JsonRepository::CountIterations(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Metadata().iterations_size());
}

// ------------------------------------------------------------
// Runs
// ------------------------------------------------------------

Result JsonRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  return InsertDense(TX(t).MutableMetadata().mutable_runs(), r, EntityKind::kRun);
}

Result JsonRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  return UpdateDense(TX(t).MutableMetadata().mutable_runs(), r, EntityKind::kRun);
}

std::optional<model::RunRecord> JsonRepository::GetRun(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Metadata().runs(), id);
}

uint64_t JsonRepository::CountRuns(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Metadata().runs_size());
}

// ------------------------------------------------------------
// Parameters
// ------------------------------------------------------------

Result JsonRepository::InsertParameter(Transaction& t, const model::ParameterRecord& r) {
  return InsertDense(TX(t).MutableParameters().mutable_parameters(), r, EntityKind::kParameter);
}

Result JsonRepository::UpdateParameter(Transaction& t, const model::ParameterRecord& r) {
  return UpdateDense(TX(t).MutableParameters().mutable_parameters(), r, EntityKind::kParameter);
}

std::optional<model::ParameterRecord> JsonRepository::GetParameter(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Parameters().parameters(), id);
}

uint64_t JsonRepository::CountParameters(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Parameters().parameters_size());
}

// ------------------------------------------------------------
// Loops
// ------------------------------------------------------------

Result JsonRepository::InsertLoop(Transaction& t, const model::LoopRecord& r) {
  return InsertDense(TX(t).MutableMetadata().mutable_loops(), r, EntityKind::kLoop);
}

Result JsonRepository::UpdateLoop(Transaction& t, const model::LoopRecord& r) {
  return UpdateDense(TX(t).MutableMetadata().mutable_loops(), r, EntityKind::kLoop);
}

std::optional<model::LoopRecord> JsonRepository::GetLoop(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Metadata().loops(), id);
}

uint64_t JsonRepository::CountLoops(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Metadata().loops_size());
}

// ------------------------------------------------------------
// Submissions
// ------------------------------------------------------------

Result JsonRepository::InsertSubmission(Transaction& t, const model::SubmissionRecord& r) {
  return InsertDense(TX(t).MutableSubmissions().mutable_submissions(), r, EntityKind::kSubmission);
}

Result JsonRepository::UpdateSubmission(Transaction& t, const model::SubmissionRecord& r) {
  return UpdateDense(TX(t).MutableSubmissions().mutable_submissions(), r, EntityKind::kSubmission);
}

std::optional<model::SubmissionRecord> JsonRepository::GetSubmission(Transaction& t, uint64_t id) {
  return GetDense(TX(t).Submissions().submissions(), id);
}

uint64_t JsonRepository::CountSubmissions(Transaction& t) {
  return static_cast<uint64_t>(TX(t).Submissions().submissions_size());
}

// ------------------------------------------------------------
// Template components
// ------------------------------------------------------------

model::TemplateComponents JsonRepository::GetTemplateComponents(Transaction& t) {
  return model::DecodeComponents(TX(t).Metadata().template_components());
}

Result JsonRepository::MergeTemplateComponents(Transaction& t, const model::TemplateComponents& components) {
  auto& doc    = TX(t).MutableMetadata();
  auto  merged = model::DecodeComponents(doc.template_components());
  model::MergeComponents(merged, components);
  doc.clear_template_components();
  model::EncodeComponents(merged, doc.mutable_template_components());
  return Result::Ok();
}

// ------------------------------------------------------------
// Workflow metadata
// ------------------------------------------------------------

std::optional<model::WorkflowInfo> JsonRepository::GetWorkflowInfo(Transaction& t) {
  const auto& doc = TX(t).Metadata();
  if (!doc.has_workflow()) return std::nullopt;
  return model::Decode(doc.workflow());
}

Result JsonRepository::InsertWorkflowInfo(Transaction& t, const model::WorkflowInfo& info) {
  if (TX(t).Metadata().has_workflow()) return Result::Err(ErrorCode::AlreadyExists, "workflow metadata already exists");
  *TX(t).MutableMetadata().mutable_workflow() = model::Encode(info);
  return Result::Ok();
}

} // namespace jobflow::db::json
