#include "repair_scheduler.hpp"

#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace dashstream::repair {

using observability::StringField;

namespace {

std::string Trim(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

} // namespace

RepairScheduler::RepairScheduler(std::shared_ptr<RepairWorker> worker, RepairFn repair) : worker_(std::move(worker)), repair_(std::move(repair)) {
  if (!worker_ || !repair_) {
    throw std::invalid_argument("RepairScheduler: worker and repair function are required");
  }
}

RepairScheduler::~RepairScheduler() {
  // queued runs call back into repair_
  worker_->WaitForIdle();
}

void RepairScheduler::Schedule(const PlaybackErrorReport& report) {
  auto session_id = Trim(report.session_id);
  if (session_id.empty() || report.source_type != dashstream::v1::SOURCE_TYPE_LOCAL) {
    return;
  }

  PlaybackErrorReport normalized = report;
  normalized.session_id          = session_id;

  std::lock_guard lock(mutex_);

  if (!in_flight_.Contains(session_id)) {
    StartLocked(session_id, std::move(normalized));
    return;
  }

  if (follow_ups_.count(session_id) > 0) {
    DASHSTREAM_LOG_DEBUG("playback error repair dropped, follow-up already queued", {StringField("session_id", session_id)});
    observability::Metrics::Instance().RecordRepair("dropped");
    return;
  }

  follow_ups_.emplace(session_id, std::move(normalized));
  DASHSTREAM_LOG_DEBUG("playback error repair queued as follow-up", {StringField("session_id", session_id)});
}

void RepairScheduler::StartLocked(const std::string& session_id, PlaybackErrorReport report) {
  bool posted   = true;
  auto executor = [this, session_id, &posted](auto&& task) {
    posted = worker_->Post([this, session_id, task = std::move(task)]() mutable {
      task();
      DrainFollowUp(session_id);
    });
    return posted;
  };

  // the outcome is observed through logs only
  util::Coalesce(in_flight_, session_id, [this, report = std::move(report)] { RunRepair(report); }, executor);

  if (!posted) {
    follow_ups_.erase(session_id);
    DASHSTREAM_LOG_WARN("playback error repair dropped, worker stopped", {StringField("session_id", session_id)});
    observability::Metrics::Instance().RecordRepair("dropped");
  }
}

void RepairScheduler::DrainFollowUp(const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto it = follow_ups_.find(session_id);
  if (it == follow_ups_.end()) {
    return;
  }
  // a run started after settlement owns the follow-up
  if (in_flight_.Contains(session_id)) {
    return;
  }

  auto report = std::move(it->second);
  follow_ups_.erase(it);
  StartLocked(session_id, std::move(report));
}

void RepairScheduler::RunRepair(const PlaybackErrorReport& report) {
  observability::SpanScope span("repair.playback_error");
  span.SetAttribute("session_id", report.session_id);

  try {
    repair_(report);
    observability::Metrics::Instance().RecordRepair("completed");
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordRepair("failed");
    DASHSTREAM_LOG_WARN("playback error repair failed", {StringField("session_id", report.session_id), StringField("error", e.what())});
  }
}

bool RepairScheduler::IsInFlight(const std::string& session_id) const {
  return in_flight_.Contains(session_id);
}

bool RepairScheduler::HasFollowUp(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return follow_ups_.count(session_id) > 0;
}

} // namespace dashstream::repair
