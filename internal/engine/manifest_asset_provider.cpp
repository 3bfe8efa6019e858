#include "manifest_asset_provider.hpp"

#include <stdexcept>
#include <utility>

namespace dashstream::engine {

using namespace dashstream::v1;

ManifestAssetProvider::ManifestAssetProvider(std::shared_ptr<BuildEngine> engine, ManifestProfile default_profile)
    : engine_(std::move(engine)), default_profile_(default_profile) {
  if (!engine_) {
    throw std::invalid_argument("ManifestAssetProvider: build engine is required");
  }
  if (default_profile_ == MANIFEST_PROFILE_UNSPECIFIED) {
    default_profile_ = MANIFEST_PROFILE_STARTUP_SINGLE;
  }
}

DashAsset ManifestAssetProvider::EnsureLocalAsset(const DashBuildRequest& request) {
  DashBuildRequest resolved = request;
  if (resolved.manifest_profile() == MANIFEST_PROFILE_UNSPECIFIED) {
    resolved.set_manifest_profile(default_profile_);
  }

  auto asset = engine_->EnsureLocalDashSegments(resolved);
  if (asset.quality() == QUALITY_UNSPECIFIED) {
    asset.set_quality(resolved.quality());
  }
  if (asset.manifest_profile() == MANIFEST_PROFILE_UNSPECIFIED) {
    asset.set_manifest_profile(resolved.manifest_profile());
  }
  return asset;
}

} // namespace dashstream::engine
