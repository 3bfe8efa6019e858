#include "memory_session_store.hpp"

#include <stdexcept>
#include <utility>

namespace dashstream::session {

using dashstream::v1::SessionRecord;

MemorySessionStore::MemorySessionStore(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    throw std::invalid_argument("MemorySessionStore: clock is required");
  }
}

void MemorySessionStore::Put(const SessionRecord& record) {
  if (record.session_id().empty()) {
    throw std::invalid_argument("session record requires a session id");
  }

  std::lock_guard lock(mutex_);
  records_[record.session_id()] = record;
}

std::optional<SessionRecord> MemorySessionStore::Get(const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto it = records_.find(session_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  if (util::FromProto(it->second.expires_at()) <= clock_->Now()) {
    records_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

bool MemorySessionStore::Remove(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return records_.erase(session_id) > 0;
}

std::vector<std::string> MemorySessionStore::PurgeExpired() {
  const auto now = clock_->Now();

  std::lock_guard          lock(mutex_);
  std::vector<std::string> removed;
  for (auto it = records_.begin(); it != records_.end();) {
    if (util::FromProto(it->second.expires_at()) <= now) {
      removed.push_back(it->first);
      it = records_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t MemorySessionStore::Size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

} // namespace dashstream::session
