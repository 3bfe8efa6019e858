#pragma once

#include <string>
#include <string_view>

namespace dashstream::util {

// Random RFC 4122 version 4 id in canonical 8-4-4-4-12 lowercase hex.
std::string NewSessionId();

bool IsSessionId(std::string_view id);

} // namespace dashstream::util
