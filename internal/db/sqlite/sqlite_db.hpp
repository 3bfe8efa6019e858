#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace dashstream::db::sqlite {

// sqlite failure with the primary result code attached.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int result_code, const std::string& message) : std::runtime_error(message), result_code_(result_code) {
  }

  int result_code() const {
    return result_code_;
  }

 private:
  int result_code_;
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Owns one connection to the music library database.

  ":memory:" opens a private in-memory database. The handle is opened in
  serialized mode so one instance can be shared across request threads.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  const std::string& path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // true while rows remain; false once the statement is done.
  bool Step(sqlite3_stmt* stmt);

 private:
  [[noreturn]] void Fail(int rc, const std::string& context) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace dashstream::db::sqlite
