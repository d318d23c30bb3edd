#include "sqlite_db.hpp"

#include <stdexcept>

namespace jobflow::db::sqlite {

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "cannot open workflow database " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Exec("PRAGMA journal_mode=WAL;");
  Exec(options.fsync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");

  if (sqlite3_busy_timeout(db_, options.busy_timeout_ms) != SQLITE_OK) {
    std::string msg = std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg + " (" + path_ + ")");
  }
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::SetUserVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

} // namespace jobflow::db::sqlite
