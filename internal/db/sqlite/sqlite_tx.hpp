#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"

namespace jobflow::db::sqlite {

/*
  One SQLite transaction over the whole workflow database; the resource
  list passed to Begin() is ignored since the file is the only resource.

  Writers take the lock up front (BEGIN IMMEDIATE) so a commit group never
  fails half way on SQLITE_BUSY. Readers use BEGIN DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, AccessMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  AccessMode Mode() const {
    return mode_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  AccessMode                mode_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace jobflow::db::sqlite
