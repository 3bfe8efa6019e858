#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace dashstream::util {

TimePoint SystemClock::Now() const {
  return SystemTime::now();
}

void SystemClock::SleepFor(std::chrono::milliseconds d) {
  std::this_thread::sleep_for(d);
}

TimePoint Now() {
  return SystemTime::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<SystemTime::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  auto total = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (total.count() <= 0) {
    return fallback;
  }
  return total;
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds(ms));
}

std::string ToIso8601(TimePoint tp) {
  const auto  ms     = ToUnixMillis(tp);
  std::time_t secs   = static_cast<std::time_t>(ms / 1000);
  auto        millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    secs -= 1;
  }

  std::tm utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

std::string ToIso8601(const google::protobuf::Timestamp& ts) {
  return ToIso8601(FromProto(ts));
}

int64_t ElapsedMillis(TimePoint since, TimePoint now) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - since).count();
}

} // namespace dashstream::util
