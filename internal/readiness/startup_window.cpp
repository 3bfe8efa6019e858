#include "startup_window.hpp"

#include "internal/manifest/manifest_parser.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace dashstream::readiness {

using storage::common::ChunkSegmentName;
using storage::common::InitSegmentName;

namespace {

constexpr std::string_view kExtensions[] = {"m4s", "webm"};

bool AnyExtensionExists(const storage::AssetFileSystem& fs, const std::filesystem::path& dir, std::size_t rep, std::size_t chunk) {
  for (auto ext : kExtensions) {
    const auto name = chunk == 0 ? InitSegmentName(rep, ext) : ChunkSegmentName(rep, chunk, ext);
    if (fs.Exists(dir / name)) {
      return true;
    }
  }
  return false;
}

} // namespace

bool StartupWindowStatus::Ready() const {
  if (representations.empty()) {
    return false;
  }
  for (const auto& rep : representations) {
    if (!rep.Ready()) {
      return false;
    }
  }
  return true;
}

StartupWindowStatus CheckStartupWindow(const storage::AssetFileSystem& fs,
                                       const std::filesystem::path&    asset_dir,
                                       std::string_view                manifest_xml,
                                       dashstream::v1::ManifestProfile profile) {
  const auto required = manifest::RequiredRepresentations(profile);
  const auto counts   = manifest::CountTimelineSegments(manifest_xml, [&required](std::size_t index) { return required.count(index) > 0; });

  StartupWindowStatus status;
  for (auto index : required) {
    RepresentationStatus rep;
    rep.index = index;
    if (auto it = counts.find(index); it != counts.end()) {
      rep.timeline_entries = it->second;
    }

    if (rep.timeline_entries >= kStartupChunkCount) {
      rep.init_present = AnyExtensionExists(fs, asset_dir, index, 0);
      if (rep.init_present) {
        for (std::size_t chunk = 1; chunk <= kStartupChunkCount; ++chunk) {
          if (!AnyExtensionExists(fs, asset_dir, index, chunk)) {
            break;
          }
          ++rep.chunks_present;
        }
      }
    }
    status.representations.push_back(rep);
  }
  return status;
}

} // namespace dashstream::readiness
