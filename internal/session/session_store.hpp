#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dashstream/v1.hpp"

namespace dashstream::session {

/*
  Persistence for session records.

  Records expire on their own expires_at; Get never returns an expired
  record.
*/
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  virtual void                                         Put(const dashstream::v1::SessionRecord& record) = 0;
  virtual std::optional<dashstream::v1::SessionRecord> Get(const std::string& session_id)              = 0;
  virtual bool                                         Remove(const std::string& session_id)           = 0;

  // Drops every expired record and returns the removed session ids.
  virtual std::vector<std::string> PurgeExpired() = 0;
};

} // namespace dashstream::session
