#include "internal/db/sqlite/sqlite_track_repository.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using dashstream::db::sqlite::BootstrapTrackSchema;
using dashstream::db::sqlite::SqliteDB;
using dashstream::db::sqlite::SqliteTrackRepository;

std::shared_ptr<SqliteDB> OpenLibrary() {
  auto db = std::make_shared<SqliteDB>(":memory:", false);
  BootstrapTrackSchema(*db);
  db->Exec("INSERT INTO track VALUES ('t-rel', 'Artist/Album/01.flac', 1600000000123);");
  db->Exec("INSERT INTO track VALUES ('t-win', 'Artist\\Album\\02.mp3', 1600000000456);");
  db->Exec("INSERT INTO track VALUES ('t-abs', '/mnt/other/03.ogg', 1600000000789);");
  db->Exec("INSERT INTO track VALUES ('t-remote', NULL, NULL);");
  db->Exec("INSERT INTO track VALUES ('t-nomtime', 'Artist/04.flac', NULL);");
  db->Exec("INSERT INTO user_settings VALUES ('user-1', 'high');");
  db->Exec("INSERT INTO user_settings VALUES ('user-2', NULL);");
  return db;
}

void TestRelativePathJoinsMusicRoot() {
  SqliteTrackRepository repo(OpenLibrary(), "/music");

  auto source = repo.FindTrackSource("t-rel");
  assert(source);
  assert(source->file_path == "/music/Artist/Album/01.flac");
  assert(dashstream::util::ToUnixMillis(source->file_modified) == 1600000000123);
}

void TestBackslashPathsAreNormalized() {
  SqliteTrackRepository repo(OpenLibrary(), "/music");

  auto source = repo.FindTrackSource("t-win");
  assert(source);
  assert(source->file_path == "/music/Artist/Album/02.mp3");
}

void TestAbsolutePathIsJoinedUnderRoot() {
  SqliteTrackRepository repo(OpenLibrary(), "/music");

  auto source = repo.FindTrackSource("t-abs");
  assert(source && source->file_path == "/music/mnt/other/03.ogg");
}

void TestTrackWithoutLocalFileHasEmptyPath() {
  SqliteTrackRepository repo(OpenLibrary(), "/music");

  auto remote = repo.FindTrackSource("t-remote");
  assert(remote && remote->file_path.empty());

  auto no_mtime = repo.FindTrackSource("t-nomtime");
  assert(no_mtime && no_mtime->file_path.empty());

  assert(!repo.FindTrackSource("t-missing"));
}

void TestPlaybackQualityPreference() {
  SqliteTrackRepository repo(OpenLibrary(), "/music");

  assert(repo.FindPlaybackQuality("user-1") == std::optional<std::string>("high"));
  assert(!repo.FindPlaybackQuality("user-2"));
  assert(!repo.FindPlaybackQuality("user-3"));
}

void TestBootstrapIsIdempotentOnFile() {
  const auto path = std::filesystem::temp_directory_path() / "dashstream_track_repository_test.db";
  std::filesystem::remove(path);

  {
    auto db = std::make_shared<SqliteDB>(path.string(), true);
    BootstrapTrackSchema(*db);
    db->Exec("INSERT INTO track VALUES ('t1', 'a.flac', 1);");
  }
  {
    auto db = std::make_shared<SqliteDB>(path.string(), true);
    BootstrapTrackSchema(*db);
    SqliteTrackRepository repo(db, "/lib");
    auto source = repo.FindTrackSource("t1");
    assert(source && source->file_path == "/lib/a.flac");
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}

void TestNullDatabaseIsRejected() {
  bool threw = false;
  try {
    SqliteTrackRepository repo(nullptr, "/music");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRelativePathJoinsMusicRoot();
  TestBackslashPathsAreNormalized();
  TestAbsolutePathIsJoinedUnderRoot();
  TestTrackWithoutLocalFileHasEmptyPath();
  TestPlaybackQualityPreference();
  TestBootstrapIsIdempotentOnFile();
  TestNullDatabaseIsRejected();

  std::cout << "dashstream_unit_sqlite_track_repository: pass\n";
  return 0;
}
