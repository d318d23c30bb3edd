#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "jobflow/v1.hpp"

namespace jobflow::db::json {

class JsonTransaction;

/*
  Hierarchical document backend.

  A workflow directory holds three documents, one per resource:

    metadata.json     tasks, elements, iterations, runs, loops, template components
    parameters.json   parameter values and sources
    submissions.json  submissions, jobscripts, submission parts

  A write transaction copies the documents it holds and dumps them on
  commit, so a commit group costs one load and one dump per document.
*/
class JsonRepository final : public db::Repository {
public:
  static constexpr const char* kMetadataResource    = "metadata";
  static constexpr const char* kParametersResource  = "parameters";
  static constexpr const char* kSubmissionsResource = "submissions";

  explicit JsonRepository(std::filesystem::path root, bool fsync = false);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::string BackendName() const override {
    return "json";
  }
  std::vector<std::string> ResourcesFor(EntityKind kind) const override;
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
  friend class JsonTransaction;

  struct Documents {
    std::shared_ptr<const v1::MetadataDocument>    metadata;
    std::shared_ptr<const v1::ParametersDocument>  parameters;
    std::shared_ptr<const v1::SubmissionsDocument> submissions;
  };

  std::filesystem::path PathOf(const std::string& resource) const;

  // Loads (once) and returns the committed documents.
  Documents Snapshot();
  void      Publish(const Documents& changed);

  std::filesystem::path root_;
  bool                  fsync_;

  std::mutex mutex_;
  Documents  committed_;
};

}
