#pragma once

#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace jobflow::db::memory {

class MemoryTransaction;

/*
  In-process backend. Everything lives under one resource, so every commit
  step falls into a single group.
*/
class MemoryRepository final : public db::Repository {
public:
  static constexpr const char* kStateResource = "state";

  MemoryRepository();

  std::string BackendName() const override {
    return "memory";
  }
  std::vector<std::string> ResourcesFor(EntityKind) const override;
  std::unique_ptr<Transaction> Begin(const std::vector<std::string>& resources, AccessMode mode) override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t id) override;
  uint64_t CountTasks(Transaction&) override;

  Result InsertElement(Transaction&, const model::ElementRecord&) override;
  Result UpdateElement(Transaction&, const model::ElementRecord&) override;
  std::optional<model::ElementRecord> GetElement(Transaction&, uint64_t id) override;
  uint64_t CountElements(Transaction&) override;

  Result InsertIteration(Transaction&, const model::IterationRecord&) override;
  Result UpdateIteration(Transaction&, const model::IterationRecord&) override;
  std::optional<model::IterationRecord> GetIteration(Transaction&, uint64_t id) override;
  uint64_t CountIterations(Transaction&) override;

  Result InsertRun(Transaction&, const model::RunRecord&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, uint64_t id) override;
  uint64_t CountRuns(Transaction&) override;

  Result InsertParameter(Transaction&, const model::ParameterRecord&) override;
  Result UpdateParameter(Transaction&, const model::ParameterRecord&) override;
  std::optional<model::ParameterRecord> GetParameter(Transaction&, uint64_t id) override;
  uint64_t CountParameters(Transaction&) override;

  Result InsertLoop(Transaction&, const model::LoopRecord&) override;
  Result UpdateLoop(Transaction&, const model::LoopRecord&) override;
  std::optional<model::LoopRecord> GetLoop(Transaction&, uint64_t id) override;
  uint64_t CountLoops(Transaction&) override;

  Result InsertSubmission(Transaction&, const model::SubmissionRecord&) override;
  Result UpdateSubmission(Transaction&, const model::SubmissionRecord&) override;
  std::optional<model::SubmissionRecord> GetSubmission(Transaction&, uint64_t id) override;
  uint64_t CountSubmissions(Transaction&) override;

  model::TemplateComponents GetTemplateComponents(Transaction&) override;
  Result MergeTemplateComponents(Transaction&, const model::TemplateComponents&) override;

  std::optional<model::WorkflowInfo> GetWorkflowInfo(Transaction&) override;
  Result InsertWorkflowInfo(Transaction&, const model::WorkflowInfo&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::vector<model::TaskRecord>       tasks;
    std::vector<model::ElementRecord>    elements;
    std::vector<model::IterationRecord>  iterations;
    std::vector<model::RunRecord>        runs;
    std::vector<model::ParameterRecord>  parameters;
    std::vector<model::LoopRecord>       loops;
    std::vector<model::SubmissionRecord> submissions;
    model::TemplateComponents            template_components;
    std::optional<model::WorkflowInfo>   workflow;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
