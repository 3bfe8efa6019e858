#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "dashstream/v1.hpp"
#include "internal/repair/repair_worker.hpp"
#include "internal/util/coalesce.hpp"

namespace dashstream::repair {

struct PlaybackErrorReport {
  std::string                user_id;
  std::string                session_id;
  std::optional<std::string> track_id;
  dashstream::v1::SourceType source_type = dashstream::v1::SOURCE_TYPE_UNSPECIFIED;
};

/*
  RepairScheduler

  Fire-and-forget playback-error repairs, one active run per session plus at
  most one queued follow-up. Requests arriving while both slots are taken
  are dropped. Runs execute on the RepairWorker; failures are logged.
*/
class RepairScheduler {
 public:
  using RepairFn = std::function<void(const PlaybackErrorReport&)>;

  RepairScheduler(std::shared_ptr<RepairWorker> worker, RepairFn repair);
  ~RepairScheduler();

  RepairScheduler(const RepairScheduler&)            = delete;
  RepairScheduler& operator=(const RepairScheduler&) = delete;

  void Schedule(const PlaybackErrorReport& report);

  bool IsInFlight(const std::string& session_id) const;
  bool HasFollowUp(const std::string& session_id) const;

 private:
  void StartLocked(const std::string& session_id, PlaybackErrorReport report);
  void DrainFollowUp(const std::string& session_id);
  void RunRepair(const PlaybackErrorReport& report);

  std::shared_ptr<RepairWorker> worker_;
  RepairFn                      repair_;

  util::InFlightMap<void>                              in_flight_;
  mutable std::mutex                                   mutex_;
  std::unordered_map<std::string, PlaybackErrorReport> follow_ups_;
};

} // namespace dashstream::repair
