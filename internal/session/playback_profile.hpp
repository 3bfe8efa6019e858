#pragma once

#include <cstdint>
#include <string_view>

#include "dashstream/v1.hpp"

namespace dashstream::session {

enum class SourceFormat {
  kLossless,
  kLossyTranscoded,
};

inline constexpr uint32_t kTranscodeBitrateKbps = 320;

// Lossless containers: flac wav aiff aif alac ape wv tta dff dsf.
SourceFormat ClassifySourceFormat(std::string_view path);

/*
  Lossless source at original quality is passed through as FLAC with no
  bitrate. Everything else is AAC at 320 kbps.
*/
dashstream::v1::PlaybackProfile DerivePlaybackProfile(std::string_view           source_path,
                                                      dashstream::v1::Quality    quality,
                                                      dashstream::v1::SourceType source_type);

} // namespace dashstream::session
