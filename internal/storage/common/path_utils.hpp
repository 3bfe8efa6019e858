#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace dashstream::storage::common {

inline bool IsSegmentExtension(std::string_view ext) {
  return ext == "m4s" || ext == "webm";
}

// [A-Za-z0-9_.-]+ followed by .m4s or .webm
inline void ValidateSegmentName(const std::string& name) {
  const auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0 || !IsSegmentExtension(std::string_view(name).substr(dot + 1))) {
    throw util::InvalidSegmentName("invalid segment name: " + name);
  }
  for (char c : name) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
    if (!ok) {
      throw util::InvalidSegmentName("invalid segment name: " + name);
    }
  }
}

inline bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto base = root.lexically_normal();
  const auto rel  = candidate.lexically_normal().lexically_relative(base);
  return !rel.empty() && *rel.begin() != ".." && *rel.begin() != ".";
}

inline std::filesystem::path SegmentPath(const std::filesystem::path& asset_dir, const std::string& name) {
  ValidateSegmentName(name);
  auto path = (asset_dir / name).lexically_normal();
  if (!IsWithin(asset_dir, path)) {
    throw util::InvalidSegmentPath("segment path escapes asset directory: " + name);
  }
  return path;
}

inline std::string InitSegmentName(std::size_t representation, std::string_view ext) {
  return "init-" + std::to_string(representation) + "." + std::string(ext);
}

// chunk-{rep}-{5-digit ordinal}.{ext}
inline std::string ChunkSegmentName(std::size_t representation, std::size_t ordinal, std::string_view ext) {
  auto digits = std::to_string(ordinal);
  if (digits.size() < 5) {
    digits.insert(0, 5 - digits.size(), '0');
  }
  return "chunk-" + std::to_string(representation) + "-" + digits + "." + std::string(ext);
}

} // namespace dashstream::storage::common
