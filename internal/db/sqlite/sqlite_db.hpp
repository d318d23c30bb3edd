#pragma once

#include <sqlite3.h>

#include <string>

namespace jobflow::db::sqlite {

struct SqliteOptions {
  // synchronous=FULL instead of NORMAL
  bool fsync = false;

  int busy_timeout_ms = 5000;
};

/*
  Owns the sqlite3 connection to one workflow database file.

  Opened in WAL mode so a reader (e.g. `jobflow summary`) can inspect a
  workflow while another process commits to it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Throws std::runtime_error with sqlite's message.
  void Exec(const std::string& sql);

  // PRAGMA user_version; holds the workflow schema version.
  int  UserVersion();
  void SetUserVersion(int version);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace jobflow::db::sqlite
