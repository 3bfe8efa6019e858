#pragma once

#include <optional>
#include <string>

#include "dashstream/v1.hpp"

namespace dashstream::engine {

struct BuildFailure {
  std::string message;
};

/*
  Out-of-process segment builder.

  Transcoding and the cross-process build lock live behind this interface.
  Status queries are cheap and safe to call on every poll iteration.
*/
class BuildEngine {
 public:
  virtual ~BuildEngine() = default;

  // Starts or joins a build and returns where the asset will land.
  virtual dashstream::v1::DashAsset EnsureLocalDashSegments(const dashstream::v1::DashBuildRequest& request) = 0;

  // Local build tracker only.
  virtual bool HasInFlightBuild(const std::string& cache_key) = 0;

  // Local tracker combined with the distributed lock.
  virtual dashstream::v1::BuildInFlightStatus GetBuildInFlightStatus(const std::string& cache_key) = 0;

  // Terminal failure, cleared by the engine once superseded.
  virtual std::optional<BuildFailure> GetBuildFailure(const std::string& cache_key) = 0;

  virtual bool IsCacheMarkedInvalid(const std::string& cache_key) = 0;

  virtual void ForceRegenerateDashSegments(const dashstream::v1::DashBuildRequest& request) = 0;
};

} // namespace dashstream::engine
