#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobflow::db::sqlite {

/*
  Binary backend: one table per entity kind, each row the protobuf
  encoding of one record. The whole database is one resource, so every
  commit step falls into a single group and a single BEGIN IMMEDIATE.
*/
class SqliteRepository final : public db::Repository {
public:
  static constexpr const char* kDatabaseResource = "database";
  static constexpr int         kSchemaVersion    = 2;

  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates missing tables and stamps the schema version. Throws
  // std::runtime_error for a database written by a newer schema.
  void BootstrapSchema();

  std::string BackendName() const override {
    return "sqlite";
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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  template <typename Record>
  Result InsertRow(Transaction& t, const char* table, EntityKind kind, const Record& r);
  template <typename Record>
  Result UpdateRow(Transaction& t, const char* table, EntityKind kind, const Record& r);
  template <typename Message>
  std::optional<Message> GetRow(Transaction& t, const char* table, uint64_t id);
  uint64_t CountRows(Transaction& t, const char* table);

  std::shared_ptr<SqliteDB> db_;
};

}
