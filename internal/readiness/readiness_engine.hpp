#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "dashstream/v1.hpp"
#include "internal/db/track_repository.hpp"
#include "internal/engine/build_engine.hpp"
#include "internal/engine/manifest_asset_provider.hpp"
#include "internal/readiness/segment_readiness_cache.hpp"
#include "internal/storage/asset_file_system.hpp"
#include "internal/util/coalesce.hpp"
#include "internal/util/time.hpp"

namespace dashstream::readiness {

struct ReadinessOptions {
  std::chrono::milliseconds poll_interval{75};
  std::chrono::milliseconds phase_timeout{20000};
  std::chrono::milliseconds segment_timeout{20000};
  std::chrono::milliseconds segment_microcache_ttl{1500};
};

/*
  ReadinessEngine

  Decides when a session's on-disk assets are safe to serve. Waits poll the
  asset file system and the build engine's status until ready, failed, or
  past an absolute deadline.

  Concurrent manifest waits for one session share a single polling loop;
  sequential waits always re-read the manifest. Concurrent segment waits for
  one session_id:segment pair share a loop and successful checks are
  remembered for a short TTL.

  Each wait phase triggers at most one self-heal, and only when neither a
  local nor a distributed build is in flight.
*/
class ReadinessEngine {
 public:
  ReadinessEngine(std::shared_ptr<engine::BuildEngine>           build_engine,
                  std::shared_ptr<engine::ManifestAssetProvider> provider,
                  std::shared_ptr<db::TrackRepository>           tracks,
                  std::shared_ptr<storage::AssetFileSystem>      fs,
                  std::shared_ptr<util::Clock>                   clock,
                  ReadinessOptions                               options);

  // Throws util::AssetBuildFailed or util::AssetNotReady.
  void WaitForManifestReady(const dashstream::v1::SessionRecord& session, util::TimePoint deadline);

  // Returns the resolved path. Throws util::InvalidSegmentName,
  // util::InvalidSegmentPath, util::AssetBuildFailed or util::AssetNotReady.
  std::filesystem::path WaitForSegmentReady(const dashstream::v1::SessionRecord& session, const std::string& segment_name);

  std::filesystem::path ResolveSegmentPath(const dashstream::v1::SessionRecord& session, const std::string& segment_name) const;

  const ReadinessOptions& options() const {
    return options_;
  }

  std::size_t CachedSegmentCount() const {
    return segment_cache_.Size();
  }

 private:
  void        RunManifestWait(const dashstream::v1::SessionRecord& session, util::TimePoint deadline);
  std::string RunSegmentWait(const dashstream::v1::SessionRecord& session, const std::filesystem::path& path, const std::string& cache_key);
  bool        IsStartupWindowReady(const dashstream::v1::SessionRecord& session);
  void        ThrowIfBuildFailed(const dashstream::v1::SessionRecord& session);

  enum class SelfHealOutcome {
    kBuildInFlight,
    kSkipped,
    kFailed,
    kTriggered,
  };

  SelfHealOutcome TrySelfHeal(const dashstream::v1::SessionRecord& session, const char* reason);

  std::shared_ptr<engine::BuildEngine>           build_engine_;
  std::shared_ptr<engine::ManifestAssetProvider> provider_;
  std::shared_ptr<db::TrackRepository>           tracks_;
  std::shared_ptr<storage::AssetFileSystem>      fs_;
  std::shared_ptr<util::Clock>                   clock_;
  ReadinessOptions                               options_;

  SegmentReadinessCache          segment_cache_;
  util::InFlightMap<void>        manifest_waits_;
  util::InFlightMap<std::string> segment_waits_;
};

} // namespace dashstream::readiness
