#include "session_reference_table.hpp"

#include <algorithm>

namespace dashstream::eviction {

void SessionReferenceTable::EraseIndexLocked(const std::string& session_id, const std::string& cache_key) {
  auto range = by_cache_key_.equal_range(cache_key);
  for (auto it = range.first; it != range.second; ++it) {
    if (it->second == session_id) {
      by_cache_key_.erase(it);
      break;
    }
  }
}

void SessionReferenceTable::RegisterSessionReference(const std::string& session_id, const std::string& cache_key) {
  if (session_id.empty() || cache_key.empty()) {
    return;
  }

  std::lock_guard lock(mutex_);

  if (auto existing = by_session_.find(session_id); existing != by_session_.end()) {
    if (existing->second == cache_key) {
      return;
    }
    EraseIndexLocked(session_id, existing->second);
  }

  by_session_[session_id] = cache_key;
  by_cache_key_.emplace(cache_key, session_id);
}

void SessionReferenceTable::ClearSessionReference(const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto it = by_session_.find(session_id);
  if (it == by_session_.end()) {
    return;
  }

  EraseIndexLocked(session_id, it->second);
  by_session_.erase(it);
}

bool SessionReferenceTable::HasReferences(const std::string& cache_key) const {
  std::lock_guard lock(mutex_);
  return by_cache_key_.count(cache_key) > 0;
}

std::size_t SessionReferenceTable::ReferenceCount(const std::string& cache_key) const {
  std::lock_guard lock(mutex_);
  return by_cache_key_.count(cache_key);
}

std::vector<std::string> SessionReferenceTable::ReferencedCacheKeys() const {
  std::lock_guard lock(mutex_);

  std::vector<std::string> keys;
  for (const auto& [cache_key, session_id] : by_cache_key_) {
    if (std::find(keys.begin(), keys.end(), cache_key) == keys.end()) {
      keys.push_back(cache_key);
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace dashstream::eviction
