#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace jobflow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, AccessMode mode) : db_(std::move(db)), mode_(mode) {
  db_->Exec(mode_ == AccessMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    JOBFLOW_LOG_WARN("sqlite rollback failed", {observability::StringField("database", db_->Path()),
                                                observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  } else if (mode_ == AccessMode::kWrite) {
    JOBFLOW_LOG_DEBUG("sqlite write transaction rolled back", {observability::StringField("database", db_->Path())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace jobflow::db::sqlite
