#include "memory_repository.hpp"

#include <string>

#include "memory_tx.hpp"

namespace jobflow::db::memory {

namespace {

template <typename R>
Result InsertDense(std::vector<R>& rows, const R& r, EntityKind kind) {
  if (r.id < rows.size()) {
    return Result::Err(ErrorCode::AlreadyExists, std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " already exists");
  }
  if (r.id > rows.size()) {
    return Result::Err(ErrorCode::Conflict, std::string(EntityKindName(kind)) + " " + std::to_string(r.id) + " would leave a gap after " +
                                                std::to_string(rows.size()));
  }
  rows.push_back(r);
  return Result::Ok();
}

template <typename R>
Result UpdateDense(std::vector<R>& rows, const R& r, EntityKind kind) {
  if (r.id >= rows.size()) {
    return Result::Err(ErrorCode::NotFound, std::string(EntityKindName(kind)) + " " + std::to_string(r.id));
  }
  rows[r.id] = r;
  return Result::Ok();
}

template <typename R>
std::optional<R> GetDense(const std::vector<R>& rows, uint64_t id) {
  if (id >= rows.size()) return std::nullopt;
  return rows[id];
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::vector<std::string> MemoryRepository::ResourcesFor(EntityKind) const {
  return {kStateResource};
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin(const std::vector<std::string>&, AccessMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Tasks
// ------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  return InsertDense(TX(t).Mutable().tasks, r, EntityKind::kTask);
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  return UpdateDense(TX(t).Mutable().tasks, r, EntityKind::kTask);
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().tasks, id);
}

uint64_t MemoryRepository::CountTasks(Transaction& t) {
  return TX(t).View().tasks.size();
}

// ------------------------------------------------------------
// Elements
// ------------------------------------------------------------

Result MemoryRepository::InsertElement(Transaction& t, const model::ElementRecord& r) {
  return InsertDense(TX(t).Mutable().elements, r, EntityKind::kElement);
}

Result MemoryRepository::UpdateElement(Transaction& t, const model::ElementRecord& r) {
  return UpdateDense(TX(t).Mutable().elements, r, EntityKind::kElement);
}

std::optional<model::ElementRecord> MemoryRepository::GetElement(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().elements, id);
}

uint64_t MemoryRepository::CountElements(Transaction& t) {
  return TX(t).View().elements.size();
}

// ------------------------------------------------------------
// Iterations
// ------------------------------------------------------------

Result MemoryRepository::InsertIteration(Transaction& t, const model::IterationRecord& r) {
  return InsertDense(TX(t).Mutable().iterations, r, EntityKind::kIteration);
}

Result MemoryRepository::UpdateIteration(Transaction& t, const model::IterationRecord& r) {
  return UpdateDense(TX(t).Mutable().iterations, r, EntityKind::kIteration);
}

std::optional<model::IterationRecord> MemoryRepository::GetIteration(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().iterations, id);
}

uint64_t MemoryRepository::CountIterations(Transaction& t) {
  return TX(t).View().iterations.size();
}

// ------------------------------------------------------------
// Runs
// ------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  return InsertDense(TX(t).Mutable().runs, r, EntityKind::kRun);
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  return UpdateDense(TX(t).Mutable().runs, r, EntityKind::kRun);
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().runs, id);
}

uint64_t MemoryRepository::CountRuns(Transaction& t) {
  return TX(t).View().runs.size();
}

// ------------------------------------------------------------
// Parameters
// ------------------------------------------------------------

Result MemoryRepository::InsertParameter(Transaction& t, const model::ParameterRecord& r) {
  return InsertDense(TX(t).Mutable().parameters, r, EntityKind::kParameter);
}

Result MemoryRepository::UpdateParameter(Transaction& t, const model::ParameterRecord& r) {
  return UpdateDense(TX(t).Mutable().parameters, r, EntityKind::kParameter);
}

std::optional<model::ParameterRecord> MemoryRepository::GetParameter(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().parameters, id);
}

uint64_t MemoryRepository::CountParameters(Transaction& t) {
  return TX(t).View().parameters.size();
}

// ------------------------------------------------------------
// Loops
// ------------------------------------------------------------

Result MemoryRepository::InsertLoop(Transaction& t, const model::LoopRecord& r) {
  return InsertDense(TX(t).Mutable().loops, r, EntityKind::kLoop);
}

Result MemoryRepository::UpdateLoop(Transaction& t, const model::LoopRecord& r) {
  return UpdateDense(TX(t).Mutable().loops, r, EntityKind::kLoop);
}

std::optional<model::LoopRecord> MemoryRepository::GetLoop(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().loops, id);
}

uint64_t MemoryRepository::CountLoops(Transaction& t) {
  return TX(t).View().loops.size();
}

// ------------------------------------------------------------
// Submissions
// ------------------------------------------------------------

Result MemoryRepository::InsertSubmission(Transaction& t, const model::SubmissionRecord& r) {
  return InsertDense(TX(t).Mutable().submissions, r, EntityKind::kSubmission);
}

Result MemoryRepository::UpdateSubmission(Transaction& t, const model::SubmissionRecord& r) {
  return UpdateDense(TX(t).Mutable().submissions, r, EntityKind::kSubmission);
}

std::optional<model::SubmissionRecord> MemoryRepository::GetSubmission(Transaction& t, uint64_t id) {
  return GetDense(TX(t).View().submissions, id);
}

uint64_t MemoryRepository::CountSubmissions(Transaction& t) {
  return TX(t).View().submissions.size();
}

// ------------------------------------------------------------
// Template components
// ------------------------------------------------------------

model::TemplateComponents MemoryRepository::GetTemplateComponents(Transaction& t) {
  return TX(t).View().template_components;
}

Result MemoryRepository::MergeTemplateComponents(Transaction& t, const model::TemplateComponents& components) {
  model::MergeComponents(TX(t).Mutable().template_components, components);
  return Result::Ok();
}

// ------------------------------------------------------------
// Workflow metadata
// ------------------------------------------------------------

std::optional<model::WorkflowInfo> MemoryRepository::GetWorkflowInfo(Transaction& t) {
  return TX(t).View().workflow;
}

Result MemoryRepository::InsertWorkflowInfo(Transaction& t, const model::WorkflowInfo& info) {
  if (TX(t).View().workflow) return Result::Err(ErrorCode::AlreadyExists, "workflow metadata already exists");
  TX(t).Mutable().workflow = info;
  return Result::Ok();
}

} // namespace jobflow::db::memory
