#include "session_manager.hpp"

#include <cctype>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/db/track_repository.hpp"
#include "internal/engine/build_engine.hpp"
#include "internal/engine/manifest_asset_provider.hpp"
#include "internal/eviction/session_reference_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/readiness/readiness_engine.hpp"
#include "internal/repair/repair_worker.hpp"
#include "internal/session/playback_profile.hpp"
#include "internal/session/quality.hpp"
#include "internal/session/session_store.hpp"
#include "internal/session/session_token.hpp"
#include "internal/storage/asset_file_system.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace dashstream::session {

using namespace dashstream::v1;
using observability::BoolField;
using observability::IntField;
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

std::optional<double> NormalizePosition(std::optional<double> position) {
  if (!position || !std::isfinite(*position) || *position < 0) {
    return std::nullopt;
  }
  return position;
}

} // namespace

SessionManager::SessionManager(SessionContext ctx, SessionOptions options) : ctx_(std::move(ctx)), options_(std::move(options)) {
  if (!ctx_.store || !ctx_.signer || !ctx_.tracks || !ctx_.build_engine || !ctx_.provider || !ctx_.readiness || !ctx_.references || !ctx_.fs ||
      !ctx_.repair_worker || !ctx_.clock) {
    throw std::invalid_argument("SessionManager: incomplete session context");
  }

  repair_scheduler_ =
      std::make_unique<repair::RepairScheduler>(ctx_.repair_worker, [this](const repair::PlaybackErrorReport& report) { RepairPlaybackErrorSessionCache(report); });
}

SessionManager::~SessionManager() = default;

// ------------------------------------------------------------
// Creation
// ------------------------------------------------------------

Quality SessionManager::ResolveQualityForUser(const std::string& user_id, const std::string& desired_quality) {
  if (ParseQuality(desired_quality)) {
    return ResolveQuality(desired_quality, std::nullopt);
  }

  std::optional<std::string> preference;
  try {
    preference = ctx_.tracks->FindPlaybackQuality(user_id);
  } catch (const std::exception& e) {
    DASHSTREAM_LOG_WARN("playback quality preference lookup failed", {StringField("user_id", user_id), StringField("error", e.what())});
  }
  return ResolveQuality(desired_quality, preference);
}

CreateSessionResponse SessionManager::CreateLocalSession(const std::string& user_id, const std::string& track_id, const std::string& desired_quality) {
  observability::SpanScope span("session.create_local");
  span.SetAttribute("track_id", track_id);

  MaybeSweepExpiredSessions();

  const auto started = ctx_.clock->Now();
  const auto quality = ResolveQualityForUser(user_id, desired_quality);

  const char* phase            = "track_lookup";
  int64_t     track_lookup_ms  = 0;
  int64_t     source_access_ms = 0;
  int64_t     asset_build_ms   = 0;

  try {
    auto phase_started = ctx_.clock->Now();
    auto track         = ctx_.tracks->FindTrackSource(track_id);
    track_lookup_ms    = util::ElapsedMillis(phase_started, ctx_.clock->Now());

    if (!track) {
      throw util::TrackNotFound("Track not found");
    }
    if (track->file_path.empty()) {
      throw util::TrackNotLocallyAvailable("Track is not available for segmented local playback");
    }

    phase            = "source_access";
    phase_started    = ctx_.clock->Now();
    const bool found = ctx_.fs->Exists(track->file_path);
    source_access_ms = util::ElapsedMillis(phase_started, ctx_.clock->Now());
    if (!found) {
      throw util::TrackSourceMissing("Track source file was not found on disk");
    }

    phase         = "asset_build";
    phase_started = ctx_.clock->Now();
    DashBuildRequest request;
    request.set_track_id(track_id);
    request.set_source_path(track->file_path);
    *request.mutable_source_modified() = util::ToProto(track->file_modified);
    request.set_quality(quality);
    auto asset     = ctx_.provider->EnsureLocalAsset(request);
    asset_build_ms = util::ElapsedMillis(phase_started, ctx_.clock->Now());

    phase              = "persist_session";
    const auto now     = ctx_.clock->Now();
    const auto profile = DerivePlaybackProfile(track->file_path, quality, SOURCE_TYPE_LOCAL);
    const auto expires = std::chrono::time_point_cast<util::SystemTime::duration>(now + options_.ttl);

    SessionRecord record;
    record.set_session_id(util::NewSessionId());
    record.set_user_id(user_id);
    record.set_track_id(track_id);
    record.set_cache_key(asset.cache_key());
    record.set_quality(quality);
    record.set_source_type(SOURCE_TYPE_LOCAL);
    record.set_manifest_profile(asset.manifest_profile());
    record.set_playback_codec(profile.codec());
    if (profile.has_bitrate_kbps()) {
      record.set_playback_bitrate_kbps(profile.bitrate_kbps());
    }
    record.set_manifest_path(asset.manifest_path());
    record.set_asset_dir(asset.output_dir());
    *record.mutable_created_at() = util::ToProto(now);
    *record.mutable_expires_at() = util::ToProto(expires);

    ctx_.store->Put(record);
    ctx_.references->RegisterSessionReference(record.session_id(), record.cache_key());

    const auto status          = ctx_.build_engine->GetBuildInFlightStatus(record.cache_key());
    const bool build_in_flight = status.in_flight() || status.local_in_flight() || status.distributed_in_flight();
    const auto token           = IssueToken(record);

    CreateSessionResponse response;
    response.set_session_id(record.session_id());
    response.set_session_token(token);
    *response.mutable_expires_at()       = record.expires_at();
    response.set_manifest_url(ManifestUrl(record.session_id(), token));
    *response.mutable_playback_profile() = profile;

    auto* hints = response.mutable_engine_hints();
    hints->set_protocol(kDashProtocol);
    hints->set_source_type(SOURCE_TYPE_LOCAL);
    hints->set_recommended_engine(kRecommendedEngine);
    hints->set_asset_build_in_flight(build_in_flight);

    DASHSTREAM_LOG_INFO("session.local.create_success",
                        {StringField("session_id", record.session_id()),
                         StringField("track_id", track_id),
                         StringField("quality", QualityName(quality)),
                         StringField("cache_key", record.cache_key()),
                         IntField("track_lookup_ms", track_lookup_ms),
                         IntField("source_access_ms", source_access_ms),
                         IntField("asset_build_ms", asset_build_ms),
                         BoolField("asset_build_in_flight", build_in_flight),
                         IntField("total_ms", util::ElapsedMillis(started, ctx_.clock->Now()))});
    return response;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    DASHSTREAM_LOG_WARN("session.local.create_error",
                        {StringField("track_id", track_id),
                         StringField("quality", QualityName(quality)),
                         StringField("phase", phase),
                         IntField("track_lookup_ms", track_lookup_ms),
                         IntField("source_access_ms", source_access_ms),
                         IntField("asset_build_ms", asset_build_ms),
                         IntField("total_ms", util::ElapsedMillis(started, ctx_.clock->Now())),
                         StringField("error", e.what())});
    throw;
  }
}

std::string SessionManager::IssueToken(const SessionRecord& session) const {
  SessionTokenClaims claims;
  claims.set_type(kSessionTokenType);
  claims.set_session_id(session.session_id());
  claims.set_user_id(session.user_id());
  claims.set_track_id(session.track_id());
  claims.set_quality(session.quality());
  claims.set_source_type(session.source_type());
  claims.set_issued_at_ms(util::ToUnixMillis(ctx_.clock->Now()));
  claims.set_expires_at_ms(util::ToUnixMillis(util::FromProto(session.expires_at())));
  return ctx_.signer->Sign(claims);
}

std::string SessionManager::ManifestUrl(const std::string& session_id, const std::string& token) const {
  auto base = options_.manifest_url_base;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + session_id + "/manifest.mpd?" + kSessionTokenQueryName + "=" + token;
}

// ------------------------------------------------------------
// Lookup / heartbeat
// ------------------------------------------------------------

std::optional<SessionRecord> SessionManager::GetAuthorizedSession(const std::string& session_id, const std::string& user_id) {
  auto session = ctx_.store->Get(session_id);
  if (!session) {
    ctx_.references->ClearSessionReference(session_id);
    return std::nullopt;
  }
  if (session->user_id() != user_id) {
    return std::nullopt;
  }
  if (util::FromProto(session->expires_at()) <= ctx_.clock->Now()) {
    ctx_.store->Remove(session_id);
    ctx_.references->ClearSessionReference(session_id);
    return std::nullopt;
  }
  return session;
}

std::size_t SessionManager::SweepExpiredSessions() {
  const auto purged = ctx_.store->PurgeExpired();
  for (const auto& session_id : purged) {
    ctx_.references->ClearSessionReference(session_id);
  }

  if (!purged.empty()) {
    DASHSTREAM_LOG_DEBUG("expired sessions purged", {IntField("count", static_cast<int64_t>(purged.size()))});
  }
  return purged.size();
}

void SessionManager::MaybeSweepExpiredSessions() {
  const auto now = ctx_.clock->Now();
  {
    std::lock_guard lock(sweep_mutex_);
    if (now < next_sweep_at_) {
      return;
    }
    next_sweep_at_ = std::chrono::time_point_cast<util::SystemTime::duration>(now + options_.expired_sweep_interval);
  }

  try {
    SweepExpiredSessions();
  } catch (const std::exception& e) {
    DASHSTREAM_LOG_WARN("expired session sweep failed", {StringField("error", e.what())});
  }
}

SessionRecord SessionManager::HeartbeatSession(const SessionRecord& session, const PlaybackSnapshot& snapshot) {
  const auto now = ctx_.clock->Now();

  SessionRecord updated                = session;
  *updated.mutable_expires_at()        = util::ToProto(std::chrono::time_point_cast<util::SystemTime::duration>(now + options_.ttl));
  *updated.mutable_last_heartbeat_at() = util::ToProto(now);
  if (auto position = NormalizePosition(snapshot.position_sec)) {
    updated.set_last_known_position_sec(*position);
  }
  if (snapshot.is_playing) {
    updated.set_last_known_is_playing(*snapshot.is_playing);
  }

  ctx_.store->Put(updated);
  return updated;
}

// ------------------------------------------------------------
// Tokens
// ------------------------------------------------------------

void SessionManager::ValidateSessionToken(const SessionRecord& session, const std::string& token, const ValidateTokenOptions& options) const {
  const auto normalized = Trim(token);
  if (normalized.empty()) {
    throw util::SessionTokenRequired("Session token is required");
  }

  const auto claims = ctx_.signer->Verify(normalized);

  const bool scope_matches = claims.user_id() == session.user_id() && claims.track_id() == session.track_id() &&
                             claims.quality() == session.quality() && claims.source_type() == session.source_type();
  if (!scope_matches) {
    throw util::SessionTokenScopeMismatch("Session token scope mismatch");
  }
  if (claims.session_id() != session.session_id() && !options.allow_session_id_mismatch) {
    throw util::SessionTokenScopeMismatch("Session token scope mismatch");
  }

  const auto now_ms = util::ToUnixMillis(ctx_.clock->Now());
  if (now_ms < claims.expires_at_ms()) {
    return;
  }

  // heartbeats keep older tokens usable for the life of the session
  const bool heartbeated_since_mint =
      session.has_last_heartbeat_at() && util::ToUnixMillis(util::FromProto(session.last_heartbeat_at())) >= claims.issued_at_ms();
  const bool session_outlives_token = util::ToUnixMillis(util::FromProto(session.expires_at())) > claims.expires_at_ms();
  if (!heartbeated_since_mint && !session_outlives_token) {
    throw util::SessionTokenExpired("Session token has expired");
  }
}

// ------------------------------------------------------------
// Handoff
// ------------------------------------------------------------

HandoffSessionResponse SessionManager::CreateHandoffSession(const SessionRecord& session, const PlaybackSnapshot& snapshot) {
  double resume_at_sec = 0;
  if (auto position = NormalizePosition(snapshot.position_sec)) {
    resume_at_sec = *position;
  } else if (auto last = NormalizePosition(session.has_last_known_position_sec() ? std::optional<double>(session.last_known_position_sec()) : std::nullopt)) {
    resume_at_sec = *last;
  }

  bool should_play = true;
  if (snapshot.is_playing) {
    should_play = *snapshot.is_playing;
  } else if (session.has_last_known_is_playing()) {
    should_play = session.last_known_is_playing();
  }

  HeartbeatSession(session, PlaybackSnapshot{resume_at_sec, should_play});

  auto next = CreateLocalSession(session.user_id(), session.track_id(), QualityName(session.quality()));

  HandoffSessionResponse response;
  *response.mutable_session() = std::move(next);
  response.set_previous_session_id(session.session_id());
  response.set_resume_at_sec(resume_at_sec);
  response.set_should_play(should_play);
  return response;
}

// ------------------------------------------------------------
// Readiness
// ------------------------------------------------------------

void SessionManager::WaitForManifestReady(const SessionRecord& session) {
  const auto deadline = std::chrono::time_point_cast<util::SystemTime::duration>(ctx_.clock->Now() + ctx_.readiness->options().phase_timeout);
  ctx_.readiness->WaitForManifestReady(session, deadline);
}

void SessionManager::WaitForManifestReady(const SessionRecord& session, util::TimePoint deadline) {
  ctx_.readiness->WaitForManifestReady(session, deadline);
}

std::filesystem::path SessionManager::WaitForSegmentReady(const SessionRecord& session, const std::string& segment_name) {
  return ctx_.readiness->WaitForSegmentReady(session, segment_name);
}

std::filesystem::path SessionManager::ResolveSegmentPath(const SessionRecord& session, const std::string& segment_name) const {
  return ctx_.readiness->ResolveSegmentPath(session, segment_name);
}

// ------------------------------------------------------------
// Repair
// ------------------------------------------------------------

void SessionManager::SchedulePlaybackErrorRepair(const repair::PlaybackErrorReport& report) {
  repair_scheduler_->Schedule(report);
}

void SessionManager::RepairPlaybackErrorSessionCache(const repair::PlaybackErrorReport& report) {
  auto session = GetAuthorizedSession(report.session_id, report.user_id);
  if (!session) {
    DASHSTREAM_LOG_DEBUG("playback error repair skipped, session not found", {StringField("session_id", report.session_id)});
    return;
  }

  if (report.track_id && !Trim(*report.track_id).empty() && Trim(*report.track_id) != session->track_id()) {
    DASHSTREAM_LOG_DEBUG("playback error repair skipped, stale track",
                         {StringField("session_id", report.session_id), StringField("track_id", *report.track_id)});
    return;
  }

  auto source = ctx_.tracks->FindTrackSource(session->track_id());
  if (!source || source->file_path.empty()) {
    DASHSTREAM_LOG_DEBUG("playback error repair skipped, source unavailable", {StringField("session_id", report.session_id)});
    return;
  }

  DashBuildRequest request;
  request.set_track_id(session->track_id());
  request.set_source_path(source->file_path);
  *request.mutable_source_modified() = util::ToProto(source->file_modified);
  request.set_quality(session->quality());
  request.set_manifest_profile(session->manifest_profile());

  try {
    ctx_.build_engine->ForceRegenerateDashSegments(request);
    DASHSTREAM_LOG_INFO("playback error repair regenerated segments",
                        {StringField("session_id", session->session_id()),
                         StringField("track_id", session->track_id()),
                         StringField("cache_key", session->cache_key())});
  } catch (const std::exception& e) {
    DASHSTREAM_LOG_WARN("playback error repair regeneration failed",
                        {StringField("session_id", session->session_id()), StringField("cache_key", session->cache_key()), StringField("error", e.what())});
  }
}

} // namespace dashstream::session
