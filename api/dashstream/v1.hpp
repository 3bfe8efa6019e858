#pragma once

#include "dashstream/v1/types.pb.h"

#include "dashstream/v1/session.pb.h"
#include "dashstream/v1/build.pb.h"

namespace dashstream::v1 {
inline constexpr const char* kDashProtocol          = "dash";
inline constexpr const char* kRecommendedEngine     = "videojs";
inline constexpr const char* kSessionTokenType      = "segmented-streaming-session-v1";
inline constexpr const char* kSessionTokenQueryName = "st";
}
