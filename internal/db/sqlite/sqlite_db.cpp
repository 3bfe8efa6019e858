#include "sqlite_db.hpp"

#include <array>
#include <utility>

namespace dashstream::db::sqlite {
namespace {

constexpr int kBusyTimeoutMs = 5000;

// the library database is written by the indexer while sessions read it
constexpr std::array<const char*, 2> kWalPragmas = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
};

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (const int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr); rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "sqlite open " + path_ + ": " + reason);
  }

  if (const int rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs); rc != SQLITE_OK) {
    Fail(rc, "sqlite busy_timeout");
  }
  if (wal_mode) {
    for (const char* pragma : kWalPragmas) {
      Exec(pragma);
    }
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }

  std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw SqliteError(rc, "sqlite exec: " + reason);
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr); rc != SQLITE_OK) {
    Fail(rc, "sqlite prepare");
  }
  return Statement(stmt);
}

bool SqliteDB::Step(sqlite3_stmt* stmt) {
  switch (const int rc = sqlite3_step(stmt)) {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      return false;
    default:
      Fail(rc, "sqlite step");
  }
}

void SqliteDB::Fail(int rc, const std::string& context) const {
  throw SqliteError(rc, context + ": " + sqlite3_errmsg(db_));
}

} // namespace dashstream::db::sqlite
