#include "sqlite_track_repository.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dashstream::db::sqlite {

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

void BootstrapTrackSchema(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS track (id TEXT PRIMARY KEY, file_path TEXT, file_modified_ms INTEGER);");
  db.Exec("CREATE TABLE IF NOT EXISTS user_settings (user_id TEXT PRIMARY KEY, playback_quality TEXT);");

  db.Exec("SELECT id,file_path,file_modified_ms FROM track LIMIT 1;");
  db.Exec("SELECT user_id,playback_quality FROM user_settings LIMIT 1;");
}

SqliteTrackRepository::SqliteTrackRepository(std::shared_ptr<SqliteDB> db, std::filesystem::path music_root)
    : db_(std::move(db)), music_root_(std::move(music_root)) {
  if (!db_) {
    throw std::invalid_argument("SqliteTrackRepository: database is required");
  }
}

std::optional<TrackSource> SqliteTrackRepository::FindTrackSource(const std::string& track_id) {
  auto st = db_->Prepare("SELECT file_path, file_modified_ms FROM track WHERE id = ?;");
  BindText(st.get(), 1, track_id);

  if (!db_->Step(st.get())) {
    return std::nullopt;
  }

  TrackSource source;
  auto        relative = ColText(st.get(), 0);
  if (relative.empty() || sqlite3_column_type(st.get(), 1) == SQLITE_NULL) {
    // indexed but not on local disk
    return source;
  }

  // stored paths are always library-relative, even with a leading separator
  std::replace(relative.begin(), relative.end(), '\\', '/');
  relative.erase(0, relative.find_first_not_of('/'));
  source.file_path     = (music_root_ / relative).lexically_normal().string();
  source.file_modified = util::FromUnixMillis(sqlite3_column_int64(st.get(), 1));
  return source;
}

std::optional<std::string> SqliteTrackRepository::FindPlaybackQuality(const std::string& user_id) {
  auto st = db_->Prepare("SELECT playback_quality FROM user_settings WHERE user_id = ?;");
  BindText(st.get(), 1, user_id);

  if (!db_->Step(st.get()) || sqlite3_column_type(st.get(), 0) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColText(st.get(), 0);
}

} // namespace dashstream::db::sqlite
