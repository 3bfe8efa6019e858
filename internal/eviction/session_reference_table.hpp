#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dashstream::eviction {

/*
  "This session is using this cache key" bookkeeping for asset eviction.
*/
class SessionReferenceTracker {
 public:
  virtual ~SessionReferenceTracker() = default;

  virtual void RegisterSessionReference(const std::string& session_id, const std::string& cache_key) = 0;
  virtual void ClearSessionReference(const std::string& session_id)                                 = 0;
};

/*
  In-process tracker. A session references at most one cache key;
  re-registering moves the reference. Both indices change under one lock.
*/
class SessionReferenceTable final : public SessionReferenceTracker {
 public:
  void RegisterSessionReference(const std::string& session_id, const std::string& cache_key) override;
  void ClearSessionReference(const std::string& session_id) override;

  bool                     HasReferences(const std::string& cache_key) const;
  std::size_t              ReferenceCount(const std::string& cache_key) const;
  std::vector<std::string> ReferencedCacheKeys() const;

 private:
  void EraseIndexLocked(const std::string& session_id, const std::string& cache_key);

  mutable std::mutex mutex_;

  std::unordered_map<std::string, std::string>      by_session_;
  std::unordered_multimap<std::string, std::string> by_cache_key_;
};

} // namespace dashstream::eviction
