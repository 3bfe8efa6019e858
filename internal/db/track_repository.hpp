#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace dashstream::db {

struct TrackSource {
  std::string     file_path; // absolute; empty when the track has no local file
  util::TimePoint file_modified{};
};

/*
  Library lookups used by session creation, self-heal and repair.
*/
class TrackRepository {
 public:
  virtual ~TrackRepository() = default;

  // nullopt when the track id is unknown.
  virtual std::optional<TrackSource> FindTrackSource(const std::string& track_id) = 0;

  // Stored playback_quality preference, raw as persisted.
  virtual std::optional<std::string> FindPlaybackQuality(const std::string& user_id) = 0;
};

} // namespace dashstream::db
