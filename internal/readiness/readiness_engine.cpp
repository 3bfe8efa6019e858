#include "readiness_engine.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/manifest/manifest_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/readiness/startup_window.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace dashstream::readiness {

using dashstream::v1::SessionRecord;
using observability::IntField;
using observability::StringField;

namespace {

util::TimePoint After(util::TimePoint from, std::chrono::milliseconds d) {
  return std::chrono::time_point_cast<util::SystemTime::duration>(from + d);
}

const char* OutcomeOf(const std::exception& e) {
  if (dynamic_cast<const util::AssetBuildFailed*>(&e)) {
    return "build_failed";
  }
  if (dynamic_cast<const util::AssetNotReady*>(&e)) {
    return "not_ready";
  }
  return "error";
}

} // namespace

ReadinessEngine::ReadinessEngine(std::shared_ptr<engine::BuildEngine>           build_engine,
                                 std::shared_ptr<engine::ManifestAssetProvider> provider,
                                 std::shared_ptr<db::TrackRepository>           tracks,
                                 std::shared_ptr<storage::AssetFileSystem>      fs,
                                 std::shared_ptr<util::Clock>                   clock,
                                 ReadinessOptions                               options)
    : build_engine_(std::move(build_engine)),
      provider_(std::move(provider)),
      tracks_(std::move(tracks)),
      fs_(std::move(fs)),
      clock_(std::move(clock)),
      options_(options),
      segment_cache_(options.segment_microcache_ttl) {
  if (!build_engine_ || !provider_ || !tracks_ || !fs_ || !clock_) {
    throw std::invalid_argument("ReadinessEngine: missing dependency");
  }
}

std::filesystem::path ReadinessEngine::ResolveSegmentPath(const SessionRecord& session, const std::string& segment_name) const {
  return storage::common::SegmentPath(session.asset_dir(), segment_name);
}

// ------------------------------------------------------------
// Manifest
// ------------------------------------------------------------

void ReadinessEngine::WaitForManifestReady(const SessionRecord& session, util::TimePoint deadline) {
  observability::SpanScope span("readiness.wait_manifest");
  span.SetAttribute("session_id", session.session_id());

  const auto started = clock_->Now();
  auto       future  = util::Coalesce(manifest_waits_, session.session_id(), [this, session, deadline] { RunManifestWait(session, deadline); });

  try {
    future.get();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordReadinessWait("manifest", OutcomeOf(e));
    observability::Metrics::Instance().ObserveReadinessWaitMs("manifest", static_cast<double>(util::ElapsedMillis(started, clock_->Now())));
    throw;
  }

  observability::Metrics::Instance().RecordReadinessWait("manifest", "ready");
  observability::Metrics::Instance().ObserveReadinessWaitMs("manifest", static_cast<double>(util::ElapsedMillis(started, clock_->Now())));
}

void ReadinessEngine::RunManifestWait(const SessionRecord& session, util::TimePoint deadline) {
  const std::filesystem::path    manifest_path = session.manifest_path();
  const auto                     started       = clock_->Now();
  std::optional<util::TimePoint> healed_at;
  bool                           heal_used = false;

  // Phase 1: the manifest file itself.
  while (true) {
    ThrowIfBuildFailed(session);

    if (fs_->Exists(manifest_path)) {
      break;
    }

    if (!heal_used) {
      const auto outcome = TrySelfHeal(session, "manifest_missing");
      heal_used          = outcome != SelfHealOutcome::kBuildInFlight;
      if (outcome == SelfHealOutcome::kTriggered) {
        healed_at = clock_->Now();
      }
    }

    if (clock_->Now() >= deadline) {
      DASHSTREAM_LOG_WARN("manifest wait timed out",
                          {StringField("session_id", session.session_id()),
                           StringField("cache_key", session.cache_key()),
                           StringField("phase", "manifest"),
                           IntField("elapsed_ms", util::ElapsedMillis(started, clock_->Now()))});
      throw util::AssetNotReady("manifest not ready for session " + session.session_id());
    }
    clock_->SleepFor(options_.poll_interval);
  }

  // Phase 2: startup window. A rebuild gets a full phase of its own.
  auto phase_deadline = deadline;
  if (healed_at) {
    phase_deadline = std::max(deadline, After(*healed_at, options_.phase_timeout));
  }
  heal_used = false;

  while (true) {
    ThrowIfBuildFailed(session);

    if (IsStartupWindowReady(session)) {
      DASHSTREAM_LOG_DEBUG("manifest ready",
                           {StringField("session_id", session.session_id()),
                            StringField("cache_key", session.cache_key()),
                            IntField("elapsed_ms", util::ElapsedMillis(started, clock_->Now()))});
      return;
    }

    if (!heal_used) {
      const auto outcome = TrySelfHeal(session, "startup_window_missing");
      heal_used          = outcome != SelfHealOutcome::kBuildInFlight;
      if (outcome == SelfHealOutcome::kTriggered) {
        phase_deadline = std::max(phase_deadline, After(clock_->Now(), options_.phase_timeout));
      }
    }

    if (clock_->Now() >= phase_deadline) {
      DASHSTREAM_LOG_WARN("manifest wait timed out",
                          {StringField("session_id", session.session_id()),
                           StringField("cache_key", session.cache_key()),
                           StringField("phase", "startup_window"),
                           IntField("elapsed_ms", util::ElapsedMillis(started, clock_->Now()))});
      throw util::AssetNotReady("startup segments not ready for session " + session.session_id());
    }
    clock_->SleepFor(options_.poll_interval);
  }
}

bool ReadinessEngine::IsStartupWindowReady(const SessionRecord& session) {
  auto manifest = fs_->ReadFile(session.manifest_path());
  if (!manifest) {
    return false;
  }

  try {
    return CheckStartupWindow(*fs_, session.asset_dir(), *manifest, session.manifest_profile()).Ready();
  } catch (const manifest::ManifestParseError& e) {
    // a manifest mid-rewrite parses on a later poll
    DASHSTREAM_LOG_DEBUG("manifest not parseable yet", {StringField("session_id", session.session_id()), StringField("error", e.what())});
    return false;
  }
}

// ------------------------------------------------------------
// Segments
// ------------------------------------------------------------

std::filesystem::path ReadinessEngine::WaitForSegmentReady(const SessionRecord& session, const std::string& segment_name) {
  observability::SpanScope span("readiness.wait_segment");
  span.SetAttribute("session_id", session.session_id());
  span.SetAttribute("segment", segment_name);

  auto       path    = ResolveSegmentPath(session, segment_name);
  const auto key     = SegmentReadinessCache::Key(session.session_id(), segment_name);
  const auto started = clock_->Now();

  if (!build_engine_->IsCacheMarkedInvalid(session.cache_key()) && segment_cache_.IsFresh(key, started)) {
    span.AddEvent("microcache_hit");
    observability::Metrics::Instance().RecordReadinessWait("segment", "ready");
    return path;
  }

  auto future = util::Coalesce(segment_waits_, key, [this, session, path, key] { return RunSegmentWait(session, path, key); });

  try {
    path = future.get();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordReadinessWait("segment", OutcomeOf(e));
    throw;
  }

  observability::Metrics::Instance().RecordReadinessWait("segment", "ready");
  observability::Metrics::Instance().ObserveReadinessWaitMs("segment", static_cast<double>(util::ElapsedMillis(started, clock_->Now())));
  return path;
}

std::string ReadinessEngine::RunSegmentWait(const SessionRecord& session, const std::filesystem::path& path, const std::string& cache_key) {
  const auto deadline  = After(clock_->Now(), options_.segment_timeout);
  bool       heal_used = false;

  while (true) {
    ThrowIfBuildFailed(session);

    if (fs_->Exists(path)) {
      // an invalidated cache key is served from disk but never remembered
      if (!build_engine_->IsCacheMarkedInvalid(session.cache_key())) {
        segment_cache_.MarkReady(cache_key, clock_->Now());
      }
      return path.string();
    }

    if (!heal_used) {
      heal_used = TrySelfHeal(session, "segment_missing") != SelfHealOutcome::kBuildInFlight;
    }

    if (clock_->Now() >= deadline) {
      DASHSTREAM_LOG_WARN("segment wait timed out",
                          {StringField("session_id", session.session_id()),
                           StringField("cache_key", session.cache_key()),
                           StringField("segment", path.filename().string())});
      throw util::AssetNotReady("segment " + path.filename().string() + " not ready for session " + session.session_id());
    }
    clock_->SleepFor(options_.poll_interval);
  }
}

// ------------------------------------------------------------
// Build signals
// ------------------------------------------------------------

void ReadinessEngine::ThrowIfBuildFailed(const SessionRecord& session) {
  auto failure = build_engine_->GetBuildFailure(session.cache_key());
  if (!failure) {
    return;
  }

  DASHSTREAM_LOG_WARN("asset build failed",
                      {StringField("session_id", session.session_id()),
                       StringField("cache_key", session.cache_key()),
                       StringField("error", failure->message)});
  throw util::AssetBuildFailed(failure->message.empty() ? "asset build failed for " + session.cache_key() : failure->message);
}

ReadinessEngine::SelfHealOutcome ReadinessEngine::TrySelfHeal(const SessionRecord& session, const char* reason) {
  const auto status = build_engine_->GetBuildInFlightStatus(session.cache_key());
  if (status.in_flight() || status.local_in_flight() || status.distributed_in_flight()) {
    // a remote pod deposits files on the shared volume; nothing to look up
    return SelfHealOutcome::kBuildInFlight;
  }

  auto& metrics = observability::Metrics::Instance();

  std::optional<db::TrackSource> source;
  try {
    source = tracks_->FindTrackSource(session.track_id());
  } catch (const std::exception& e) {
    DASHSTREAM_LOG_WARN("self-heal track lookup failed",
                        {StringField("session_id", session.session_id()), StringField("track_id", session.track_id()), StringField("error", e.what())});
    metrics.RecordSelfHeal(reason, false);
    return SelfHealOutcome::kFailed;
  }

  if (!source || source->file_path.empty()) {
    DASHSTREAM_LOG_WARN("self-heal skipped, track source unavailable",
                        {StringField("session_id", session.session_id()), StringField("track_id", session.track_id())});
    metrics.RecordSelfHeal(reason, false);
    return SelfHealOutcome::kSkipped;
  }

  if (!fs_->Exists(source->file_path)) {
    DASHSTREAM_LOG_WARN("self-heal skipped, track source missing on disk",
                        {StringField("session_id", session.session_id()),
                         StringField("track_id", session.track_id()),
                         StringField("source_path", source->file_path)});
    metrics.RecordSelfHeal(reason, false);
    return SelfHealOutcome::kSkipped;
  }

  dashstream::v1::DashBuildRequest request;
  request.set_track_id(session.track_id());
  request.set_source_path(source->file_path);
  *request.mutable_source_modified() = util::ToProto(source->file_modified);
  request.set_quality(session.quality());
  request.set_manifest_profile(session.manifest_profile());

  try {
    provider_->EnsureLocalAsset(request);
  } catch (const std::exception& e) {
    DASHSTREAM_LOG_WARN("self-heal rebuild request failed",
                        {StringField("session_id", session.session_id()), StringField("cache_key", session.cache_key()), StringField("error", e.what())});
    metrics.RecordSelfHeal(reason, false);
    return SelfHealOutcome::kFailed;
  }

  DASHSTREAM_LOG_INFO("self-heal rebuild requested",
                      {StringField("session_id", session.session_id()),
                       StringField("track_id", session.track_id()),
                       StringField("cache_key", session.cache_key()),
                       StringField("reason", reason)});
  metrics.RecordSelfHeal(reason, true);
  return SelfHealOutcome::kTriggered;
}

} // namespace dashstream::readiness
