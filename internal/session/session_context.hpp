#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "dashstream/v1.hpp"

namespace dashstream::engine {
class BuildEngine;
class ManifestAssetProvider;
} // namespace dashstream::engine
namespace dashstream::db {
class TrackRepository;
}
namespace dashstream::eviction {
class SessionReferenceTracker;
}
namespace dashstream::readiness {
class ReadinessEngine;
}
namespace dashstream::repair {
class RepairWorker;
}
namespace dashstream::storage {
class AssetFileSystem;
}
namespace dashstream::util {
class Clock;
}

namespace dashstream::session {

class SessionStore;
class SessionTokenSigner;

/*
  Dependency container for SessionManager.
*/
struct SessionContext {
  std::shared_ptr<SessionStore>                      store;
  std::shared_ptr<SessionTokenSigner>                signer;
  std::shared_ptr<db::TrackRepository>               tracks;
  std::shared_ptr<engine::BuildEngine>               build_engine;
  std::shared_ptr<engine::ManifestAssetProvider>     provider;
  std::shared_ptr<readiness::ReadinessEngine>        readiness;
  std::shared_ptr<eviction::SessionReferenceTracker> references;
  std::shared_ptr<storage::AssetFileSystem>          fs;
  std::shared_ptr<repair::RepairWorker>              repair_worker;
  std::shared_ptr<util::Clock>                       clock;
};

struct SessionOptions {
  std::chrono::milliseconds ttl{std::chrono::seconds(300)};
  std::chrono::milliseconds expired_sweep_interval{std::chrono::seconds(60)};
  std::string               manifest_url_base{"/api/streaming/v1/sessions"};
};

} // namespace dashstream::session
