#pragma once

#include <memory>

#include "dashstream/v1.hpp"
#include "internal/engine/build_engine.hpp"

namespace dashstream::engine {

/*
  Resolves the asset for a build request.

  Fills the configured default manifest profile into requests that leave it
  unspecified, and the requested quality/profile into engine answers that
  leave them unspecified.
*/
class ManifestAssetProvider {
 public:
  ManifestAssetProvider(std::shared_ptr<BuildEngine> engine, dashstream::v1::ManifestProfile default_profile);
  virtual ~ManifestAssetProvider() = default;

  virtual dashstream::v1::DashAsset EnsureLocalAsset(const dashstream::v1::DashBuildRequest& request);

  dashstream::v1::ManifestProfile default_profile() const {
    return default_profile_;
  }

 private:
  std::shared_ptr<BuildEngine>    engine_;
  dashstream::v1::ManifestProfile default_profile_;
};

} // namespace dashstream::engine
