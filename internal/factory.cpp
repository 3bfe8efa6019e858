#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_track_repository.hpp"
#include "internal/engine/build_engine.hpp"
#include "internal/engine/manifest_asset_provider.hpp"
#include "internal/eviction/session_reference_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/readiness/readiness_engine.hpp"
#include "internal/repair/repair_worker.hpp"
#include "internal/session/memory_session_store.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/session/session_token.hpp"
#include "internal/storage/asset_file_system.hpp"
#include "internal/util/time.hpp"

namespace dashstream::factory {

namespace cfg = dashstream::runtime::config;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<db::TrackRepository> BuildTrackRepository(const cfg::RuntimeConfig& config) {
  const auto& library = config.library();
  const auto  path    = library.sqlite().path().empty() ? std::string(":memory:") : library.sqlite().path();

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, library.sqlite().wal_mode());
  db::sqlite::BootstrapTrackSchema(*sqlite_db);
  return std::make_shared<db::sqlite::SqliteTrackRepository>(std::move(sqlite_db), library.music_root());
}

readiness::ReadinessOptions BuildReadinessOptions(const cfg::ReadinessConfig& readiness) {
  readiness::ReadinessOptions options;
  options.poll_interval          = util::ToMillis(readiness.poll_interval(), 75ms);
  options.phase_timeout          = util::ToMillis(readiness.phase_timeout(), 20000ms);
  options.segment_timeout        = util::ToMillis(readiness.segment_timeout(), 20000ms);
  options.segment_microcache_ttl = util::ToMillis(readiness.segment_microcache_ttl(), 1500ms);
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const cfg::RuntimeConfig&                 config,
                  std::shared_ptr<engine::BuildEngine>      build_engine,
                  std::shared_ptr<storage::AssetFileSystem> fs,
                  std::shared_ptr<util::Clock>              clock) {
  if (!build_engine) {
    throw std::invalid_argument("factory::Build: build engine is required");
  }

  Application app;
  app.clock = clock ? std::move(clock) : std::make_shared<util::SystemClock>();
  app.fs    = fs ? std::move(fs) : std::make_shared<storage::LocalAssetFileSystem>();

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.tracks     = BuildTrackRepository(config);
  app.references = std::make_shared<eviction::SessionReferenceTable>();
  app.store      = std::make_shared<session::MemorySessionStore>(app.clock);
  app.provider   = std::make_shared<engine::ManifestAssetProvider>(build_engine, config.session().manifest_profile());

  // ------------------------------------------------------------------
  // Readiness
  // ------------------------------------------------------------------
  app.readiness = std::make_shared<readiness::ReadinessEngine>(build_engine, app.provider, app.tracks, app.fs, app.clock, BuildReadinessOptions(config.readiness()));

  // ------------------------------------------------------------------
  // Repair worker
  // ------------------------------------------------------------------
  app.repair_worker = std::make_shared<repair::RepairWorker>(config.repair().worker_threads());
  app.repair_worker->Start();

  // ------------------------------------------------------------------
  // Sessions
  // ------------------------------------------------------------------
  session::SessionContext ctx;
  ctx.store         = app.store;
  ctx.signer        = std::make_shared<session::SessionTokenSigner>(config.session().token_secret());
  ctx.tracks        = app.tracks;
  ctx.build_engine  = build_engine;
  ctx.provider      = app.provider;
  ctx.readiness     = app.readiness;
  ctx.references    = app.references;
  ctx.fs            = app.fs;
  ctx.repair_worker = app.repair_worker;
  ctx.clock         = app.clock;

  session::SessionOptions options;
  options.ttl                    = util::ToMillis(config.session().ttl(), 300000ms);
  options.expired_sweep_interval = util::ToMillis(config.session().expired_sweep_interval(), 60000ms);
  if (!config.session().manifest_url_base().empty()) {
    options.manifest_url_base = config.session().manifest_url_base();
  }

  app.sessions = std::make_shared<session::SessionManager>(std::move(ctx), std::move(options));

  DASHSTREAM_LOG_INFO("dashstream components ready",
                      {observability::StringField("music_root", config.library().music_root()),
                       observability::IntField("repair_workers", static_cast<std::int64_t>(config.repair().worker_threads()))});
  return app;
}

} // namespace dashstream::factory
