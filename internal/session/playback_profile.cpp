#include "playback_profile.hpp"

#include <array>
#include <cctype>
#include <string>

namespace dashstream::session {

using namespace dashstream::v1;

namespace {

constexpr std::array<std::string_view, 10> kLosslessExtensions = {"flac", "wav", "aiff", "aif", "alac", "ape", "wv", "tta", "dff", "dsf"};

std::string LowerExtension(std::string_view path) {
  const auto slash = path.find_last_of("/\\");
  const auto dot   = path.rfind('.');
  if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
    return {};
  }

  std::string ext;
  for (char c : path.substr(dot + 1)) {
    ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return ext;
}

} // namespace

SourceFormat ClassifySourceFormat(std::string_view path) {
  const auto ext = LowerExtension(path);
  for (auto lossless : kLosslessExtensions) {
    if (ext == lossless) {
      return SourceFormat::kLossless;
    }
  }
  return SourceFormat::kLossyTranscoded;
}

PlaybackProfile DerivePlaybackProfile(std::string_view source_path, Quality quality, SourceType source_type) {
  PlaybackProfile profile;
  profile.set_protocol(kDashProtocol);
  profile.set_source_type(source_type);

  if (ClassifySourceFormat(source_path) == SourceFormat::kLossless && quality == QUALITY_ORIGINAL) {
    profile.set_codec(PLAYBACK_CODEC_FLAC);
    return profile;
  }

  profile.set_codec(PLAYBACK_CODEC_AAC);
  profile.set_bitrate_kbps(kTranscodeBitrateKbps);
  return profile;
}

} // namespace dashstream::session
