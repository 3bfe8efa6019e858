#include "quality.hpp"

#include <cctype>

namespace dashstream::session {

using namespace dashstream::v1;

namespace {

std::string Normalize(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }

  std::string out;
  out.reserve(end - begin);
  for (auto i = begin; i < end; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(value[i]))));
  }
  return out;
}

} // namespace

std::optional<Quality> ParseQuality(std::string_view value) {
  const auto normalized = Normalize(value);
  if (normalized == "original") {
    return QUALITY_ORIGINAL;
  }
  if (normalized == "high") {
    return QUALITY_HIGH;
  }
  if (normalized == "medium") {
    return QUALITY_MEDIUM;
  }
  if (normalized == "low") {
    return QUALITY_LOW;
  }
  return std::nullopt;
}

std::string QualityName(Quality quality) {
  switch (quality) {
    case QUALITY_ORIGINAL:
      return "original";
    case QUALITY_HIGH:
      return "high";
    case QUALITY_MEDIUM:
      return "medium";
    case QUALITY_LOW:
      return "low";
    default:
      return "unspecified";
  }
}

Quality ResolveQuality(std::string_view requested, const std::optional<std::string>& preference) {
  if (auto quality = ParseQuality(requested)) {
    return *quality;
  }
  if (preference) {
    if (auto quality = ParseQuality(*preference)) {
      return *quality;
    }
  }
  return kDefaultQuality;
}

} // namespace dashstream::session
