#pragma once

#include <filesystem>
#include <memory>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/track_repository.hpp"

namespace dashstream::db::sqlite {

/*
  Track lookups over the library database.

    track(id TEXT PRIMARY KEY, file_path TEXT, file_modified_ms INTEGER)
    user_settings(user_id TEXT PRIMARY KEY, playback_quality TEXT)

  file_path is stored relative to the music root (either slash style).
*/
class SqliteTrackRepository final : public TrackRepository {
 public:
  SqliteTrackRepository(std::shared_ptr<SqliteDB> db, std::filesystem::path music_root);

  std::optional<TrackSource> FindTrackSource(const std::string& track_id) override;
  std::optional<std::string> FindPlaybackQuality(const std::string& user_id) override;

 private:
  std::shared_ptr<SqliteDB> db_;
  std::filesystem::path     music_root_;
};

// Creates the track and user_settings tables when absent.
void BootstrapTrackSchema(SqliteDB& db);

} // namespace dashstream::db::sqlite
