#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/commit_step.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/element_record.hpp"
#include "internal/db/model/iteration_record.hpp"
#include "internal/db/model/loop_record.hpp"
#include "internal/db/model/parameter_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/submission_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/template_components.hpp"
#include "internal/db/model/workflow_info.hpp"

namespace jobflow::db {

enum class AccessMode {
  kRead,
  kWrite,
};

/*
  Repository abstraction over the durable half of a workflow store.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - A transaction only touches the resources it was opened over
  - Reads inside a write transaction see its writes
  - IDs are dense per kind: Insert* accepts exactly id == Count*()

  The pending stage and ID allocation live above this layer; a repository
  only ever sees records whose IDs are already decided.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Resources and transactions
  // ---------------------------------------------------------------------

  virtual std::string BackendName() const = 0;

  // Named resources that must be held to read or write `kind`.
  virtual std::vector<std::string> ResourcesFor(EntityKind kind) const = 0;

  virtual std::unique_ptr<Transaction> Begin(const std::vector<std::string>& resources, AccessMode mode) = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result                            InsertTask(Transaction&, const model::TaskRecord&) = 0;
  virtual Result                            UpdateTask(Transaction&, const model::TaskRecord&) = 0;
  virtual std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t id) = 0;
  virtual uint64_t                          CountTasks(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Elements
  // ---------------------------------------------------------------------

  virtual Result                               InsertElement(Transaction&, const model::ElementRecord&) = 0;
  virtual Result                               UpdateElement(Transaction&, const model::ElementRecord&) = 0;
  virtual std::optional<model::ElementRecord> GetElement(Transaction&, uint64_t id) = 0;
  virtual uint64_t                             CountElements(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Element iterations
  // ---------------------------------------------------------------------

  virtual Result                                 InsertIteration(Transaction&, const model::IterationRecord&) = 0;
  virtual Result                                 UpdateIteration(Transaction&, const model::IterationRecord&) = 0;
  virtual std::optional<model::IterationRecord> GetIteration(Transaction&, uint64_t id) = 0;
  virtual uint64_t                               CountIterations(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result                           InsertRun(Transaction&, const model::RunRecord&) = 0;
  virtual Result                           UpdateRun(Transaction&, const model::RunRecord&) = 0;
  virtual std::optional<model::RunRecord> GetRun(Transaction&, uint64_t id) = 0;
  virtual uint64_t                         CountRuns(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Parameters
  // ---------------------------------------------------------------------

  virtual Result                                 InsertParameter(Transaction&, const model::ParameterRecord&) = 0;
  virtual Result                                 UpdateParameter(Transaction&, const model::ParameterRecord&) = 0;
  virtual std::optional<model::ParameterRecord> GetParameter(Transaction&, uint64_t id) = 0;
  virtual uint64_t                               CountParameters(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Loops
  // ---------------------------------------------------------------------

  virtual Result                            InsertLoop(Transaction&, const model::LoopRecord&) = 0;
  virtual Result                            UpdateLoop(Transaction&, const model::LoopRecord&) = 0;
  virtual std::optional<model::LoopRecord> GetLoop(Transaction&, uint64_t id) = 0;
  virtual uint64_t                          CountLoops(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Submissions
  // ---------------------------------------------------------------------

  virtual Result                                  InsertSubmission(Transaction&, const model::SubmissionRecord&) = 0;
  virtual Result                                  UpdateSubmission(Transaction&, const model::SubmissionRecord&) = 0;
  virtual std::optional<model::SubmissionRecord> GetSubmission(Transaction&, uint64_t id) = 0;
  virtual uint64_t                                CountSubmissions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Template components
  // ---------------------------------------------------------------------

  virtual model::TemplateComponents GetTemplateComponents(Transaction&) = 0;

  // Hashes already present are kept as they are.
  virtual Result MergeTemplateComponents(Transaction&, const model::TemplateComponents&) = 0;

  // ---------------------------------------------------------------------
  // Workflow metadata
  // ---------------------------------------------------------------------

  virtual std::optional<model::WorkflowInfo> GetWorkflowInfo(Transaction&) = 0;

  // Written once. A second insert returns AlreadyExists.
  virtual Result InsertWorkflowInfo(Transaction&, const model::WorkflowInfo&) = 0;
};

} // namespace jobflow::db
