#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include "dashstream/v1.hpp"
#include "internal/storage/asset_file_system.hpp"

namespace dashstream::readiness {

// Segments a player buffers before playback can start.
inline constexpr std::size_t kStartupChunkCount = 3;

struct RepresentationStatus {
  std::size_t index            = 0;
  std::size_t timeline_entries = 0;
  bool        init_present     = false;
  std::size_t chunks_present   = 0; // leading chunks 1..kStartupChunkCount found on disk

  bool Ready() const {
    return timeline_entries >= kStartupChunkCount && init_present && chunks_present >= kStartupChunkCount;
  }
};

struct StartupWindowStatus {
  std::vector<RepresentationStatus> representations;

  bool Ready() const;
};

/*
  Evaluates the startup window for every representation the profile
  requires. A required representation missing from the manifest is reported
  with zero timeline entries. Checks stop at the first missing file per
  representation.

  Throws manifest::ManifestParseError on malformed XML.
*/
StartupWindowStatus CheckStartupWindow(const storage::AssetFileSystem& fs,
                                       const std::filesystem::path&    asset_dir,
                                       std::string_view                manifest_xml,
                                       dashstream::v1::ManifestProfile profile);

} // namespace dashstream::readiness
