#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "internal/session/session_store.hpp"
#include "internal/util/time.hpp"

namespace dashstream::session {

class MemorySessionStore final : public SessionStore {
 public:
  explicit MemorySessionStore(std::shared_ptr<util::Clock> clock);

  void                                         Put(const dashstream::v1::SessionRecord& record) override;
  std::optional<dashstream::v1::SessionRecord> Get(const std::string& session_id) override;
  bool                                         Remove(const std::string& session_id) override;

  std::vector<std::string>                     PurgeExpired() override;

  std::size_t Size() const;

 private:
  std::shared_ptr<util::Clock>                                    clock_;
  mutable std::mutex                                              mutex_;
  std::unordered_map<std::string, dashstream::v1::SessionRecord> records_;
};

} // namespace dashstream::session
