#include "segment_readiness_cache.hpp"

#include <mutex>

namespace dashstream::readiness {

SegmentReadinessCache::SegmentReadinessCache(std::chrono::milliseconds ttl) : ttl_(ttl) {
}

std::string SegmentReadinessCache::Key(const std::string& session_id, const std::string& segment_name) {
  return session_id + ":" + segment_name;
}

void SegmentReadinessCache::MarkReady(const std::string& key, util::TimePoint now) {
  std::unique_lock lock(mutex_);
  if (now >= next_prune_at_) {
    PruneLocked(now);
    next_prune_at_ = std::chrono::time_point_cast<util::SystemTime::duration>(now + ttl_);
  }
  expires_at_[key] = std::chrono::time_point_cast<util::SystemTime::duration>(now + ttl_);
}

bool SegmentReadinessCache::IsFresh(const std::string& key, util::TimePoint now) const {
  std::shared_lock lock(mutex_);

  auto it = expires_at_.find(key);
  return it != expires_at_.end() && now < it->second;
}

std::size_t SegmentReadinessCache::Size() const {
  std::shared_lock lock(mutex_);
  return expires_at_.size();
}

void SegmentReadinessCache::PruneLocked(util::TimePoint now) {
  for (auto it = expires_at_.begin(); it != expires_at_.end();) {
    if (it->second <= now) {
      it = expires_at_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace dashstream::readiness
