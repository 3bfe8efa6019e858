#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "dashstream/v1.hpp"

namespace dashstream::session {

inline constexpr dashstream::v1::Quality kDefaultQuality = dashstream::v1::QUALITY_MEDIUM;

// Trimmed, case-insensitive original/high/medium/low.
std::optional<dashstream::v1::Quality> ParseQuality(std::string_view value);

std::string QualityName(dashstream::v1::Quality quality);

// Explicit request, then stored preference, then medium.
dashstream::v1::Quality ResolveQuality(std::string_view requested, const std::optional<std::string>& preference);

} // namespace dashstream::session
