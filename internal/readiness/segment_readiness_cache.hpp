#pragma once

#include <chrono>
#include <cstddef>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace dashstream::readiness {

/*
  Short-lived "segment was on disk" marks keyed by session_id:segment_name.

  Only positive results are recorded. Manifest readiness never goes through
  here since manifests grow between calls. Expired marks are swept from
  MarkReady at most once per TTL.
*/
class SegmentReadinessCache {
 public:
  explicit SegmentReadinessCache(std::chrono::milliseconds ttl);

  static std::string Key(const std::string& session_id, const std::string& segment_name);

  void MarkReady(const std::string& key, util::TimePoint now);
  bool IsFresh(const std::string& key, util::TimePoint now) const;

  std::size_t Size() const;

 private:
  // Caller holds mutex_ exclusively.
  void PruneLocked(util::TimePoint now);

  std::chrono::milliseconds                        ttl_;
  mutable std::shared_mutex                        mutex_;
  std::unordered_map<std::string, util::TimePoint> expires_at_;
  util::TimePoint                                  next_prune_at_{};
};

} // namespace dashstream::readiness
