#include "internal/factory.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_track_repository.hpp"
#include "internal/eviction/session_reference_table.hpp"
#include "internal/readiness/readiness_engine.hpp"
#include "internal/session/memory_session_store.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace std::chrono_literals;
using dashstream::config::ConfigLoader;
using dashstream::factory::Build;
using dashstream::testing::FakeAssetFileSystem;
using dashstream::testing::FakeBuildEngine;
using dashstream::testing::FakeClock;

std::filesystem::path SeedLibrary() {
  const auto path = std::filesystem::temp_directory_path() / "dashstream_factory_test.db";
  std::filesystem::remove(path);

  dashstream::db::sqlite::SqliteDB db(path.string(), false);
  dashstream::db::sqlite::BootstrapTrackSchema(db);
  db.Exec("INSERT INTO track VALUES ('track-1', 'Artist/01.mp3', 1600000000000);");
  db.Exec("INSERT INTO user_settings VALUES ('user-1', 'low');");
  return path;
}

void TestBuildWiresSessionsEndToEnd() {
  const auto db_path = SeedLibrary();

  auto config = ConfigLoader::Defaults();
  config.mutable_library()->set_music_root("/music");
  config.mutable_library()->mutable_sqlite()->set_path(db_path.string());
  config.mutable_readiness()->mutable_phase_timeout()->set_seconds(7);
  config.mutable_session()->set_manifest_url_base("/play/");

  auto engine = std::make_shared<FakeBuildEngine>();
  auto fs     = std::make_shared<FakeAssetFileSystem>();
  auto clock  = std::make_shared<FakeClock>();
  fs->Put("/music/Artist/01.mp3");

  {
    auto app = Build(config, engine, fs, clock);
    assert(app.sessions && app.readiness && app.store && app.references && app.repair_worker);
    assert(app.readiness->options().phase_timeout == 7000ms);
    assert(app.readiness->options().poll_interval == 75ms);

    auto response = app.sessions->CreateLocalSession("user-1", "track-1");
    assert(response.manifest_url().rfind("/play/" + response.session_id() + "/manifest.mpd?st=", 0) == 0);

    auto record = app.store->Get(response.session_id());
    assert(record);
    assert(record->quality() == dashstream::v1::QUALITY_LOW);
    assert(app.references->HasReferences(record->cache_key()));
    assert(dashstream::util::FromProto(record->expires_at()) == clock->Now() + 300s);

    const auto request = engine->last_request();
    assert(request.source_path() == "/music/Artist/01.mp3");
  }

  std::filesystem::remove(db_path);
}

void TestBuildDefaultsToInMemoryLibrary() {
  auto app = Build(ConfigLoader::Defaults(), std::make_shared<FakeBuildEngine>());
  assert(app.fs && app.clock);

  bool threw = false;
  try {
    app.sessions->CreateLocalSession("user-1", "track-1");
  } catch (const dashstream::util::TrackNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildRequiresEngine() {
  bool threw = false;
  try {
    (void)Build(ConfigLoader::Defaults(), nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestBuildWiresSessionsEndToEnd();
  TestBuildDefaultsToInMemoryLibrary();
  TestBuildRequiresEngine();

  std::cout << "dashstream_unit_factory: pass\n";
  return 0;
}
