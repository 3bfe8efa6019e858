#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace dashstream::util {

/*
  Time utilities: single place to control the clock source.

  Readiness polling and session expiry read time through a Clock so tests can
  drive deadlines without sleeping.
*/

using SystemTime = std::chrono::system_clock;
using TimePoint  = SystemTime::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const                            = 0;
  virtual void      SleepFor(std::chrono::milliseconds d) = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
  void      SleepFor(std::chrono::milliseconds d) override;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// 2024-01-02T03:04:05.678Z
std::string ToIso8601(TimePoint tp);
std::string ToIso8601(const google::protobuf::Timestamp& ts);

int64_t ElapsedMillis(TimePoint since, TimePoint now);

} // namespace dashstream::util
