#include "uuid.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace dashstream::util {

std::string NewSessionId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::uint64_t hi = rng();
  std::uint64_t lo = rng();
  hi               = (hi & ~std::uint64_t{0xF000}) | 0x4000;                               // version 4
  lo               = (lo & ~(std::uint64_t{0xC} << 60)) | (std::uint64_t{0x8} << 60); // RFC 4122 variant

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return buf;
}

bool IsSessionId(std::string_view id) {
  if (id.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < id.size(); ++i) {
    const char c = id[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
    } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return id[14] == '4';
}

} // namespace dashstream::util
