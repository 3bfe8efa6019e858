#pragma once

#include <memory>

#include "config/config.pb.h"

namespace dashstream::db {
class TrackRepository;
}
namespace dashstream::engine {
class BuildEngine;
class ManifestAssetProvider;
} // namespace dashstream::engine
namespace dashstream::eviction {
class SessionReferenceTable;
}
namespace dashstream::readiness {
class ReadinessEngine;
}
namespace dashstream::repair {
class RepairWorker;
}
namespace dashstream::session {
class MemorySessionStore;
class SessionManager;
} // namespace dashstream::session
namespace dashstream::storage {
class AssetFileSystem;
}
namespace dashstream::util {
class Clock;
}

namespace dashstream::factory {

/*
  Application

  Owns every long-lived component. Members are declared so that the session
  manager goes away before the repair worker it posts to.
*/
struct Application {
  std::shared_ptr<repair::RepairWorker>            repair_worker;
  std::shared_ptr<util::Clock>                     clock;
  std::shared_ptr<storage::AssetFileSystem>        fs;
  std::shared_ptr<db::TrackRepository>             tracks;
  std::shared_ptr<eviction::SessionReferenceTable> references;
  std::shared_ptr<session::MemorySessionStore>     store;
  std::shared_ptr<engine::ManifestAssetProvider>   provider;
  std::shared_ptr<readiness::ReadinessEngine>      readiness;
  std::shared_ptr<session::SessionManager>         sessions;
};

/*
  Build

  Composition root. The build engine is supplied by the host process; the
  file system and clock default to the local disk and the system clock.
*/
Application Build(const dashstream::runtime::config::RuntimeConfig& config,
                  std::shared_ptr<engine::BuildEngine>               build_engine,
                  std::shared_ptr<storage::AssetFileSystem>          fs    = nullptr,
                  std::shared_ptr<util::Clock>                       clock = nullptr);

} // namespace dashstream::factory
