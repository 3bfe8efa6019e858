#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "dashstream/v1.hpp"
#include "internal/repair/repair_scheduler.hpp"
#include "internal/session/session_context.hpp"
#include "internal/util/time.hpp"

namespace dashstream::session {

struct PlaybackSnapshot {
  std::optional<double> position_sec;
  std::optional<bool>   is_playing;
};

struct ValidateTokenOptions {
  // in-flight media requests issued under a superseded session
  bool allow_session_id_mismatch = false;
};

/*
  SessionManager

  Creates playback sessions, mints and checks their tokens, keeps them alive
  through heartbeats and forwards readiness waits and playback-error repairs.

  Token expiry is judged against the session: a token past its exp claim is
  still accepted once the session has been heartbeated since the token was
  minted.
*/
class SessionManager {
 public:
  SessionManager(SessionContext ctx, SessionOptions options);
  ~SessionManager();

  SessionManager(const SessionManager&)            = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Throws util::TrackNotFound, util::TrackNotLocallyAvailable,
  // util::TrackSourceMissing, or whatever the build engine raises.
  dashstream::v1::CreateSessionResponse CreateLocalSession(const std::string& user_id, const std::string& track_id, const std::string& desired_quality = "");

  std::optional<dashstream::v1::SessionRecord> GetAuthorizedSession(const std::string& session_id, const std::string& user_id);

  dashstream::v1::SessionRecord HeartbeatSession(const dashstream::v1::SessionRecord& session, const PlaybackSnapshot& snapshot = {});

  // Throws util::SessionTokenRequired, util::SessionTokenInvalid,
  // util::SessionTokenScopeMismatch or util::SessionTokenExpired.
  void ValidateSessionToken(const dashstream::v1::SessionRecord& session, const std::string& token, const ValidateTokenOptions& options = {}) const;

  dashstream::v1::HandoffSessionResponse CreateHandoffSession(const dashstream::v1::SessionRecord& session, const PlaybackSnapshot& snapshot = {});

  void                  WaitForManifestReady(const dashstream::v1::SessionRecord& session);
  void                  WaitForManifestReady(const dashstream::v1::SessionRecord& session, util::TimePoint deadline);
  std::filesystem::path WaitForSegmentReady(const dashstream::v1::SessionRecord& session, const std::string& segment_name);
  std::filesystem::path ResolveSegmentPath(const dashstream::v1::SessionRecord& session, const std::string& segment_name) const;

  // Fire-and-forget.
  void SchedulePlaybackErrorRepair(const repair::PlaybackErrorReport& report);

  // Runs one repair inline. Never throws for build engine failures.
  void RepairPlaybackErrorSessionCache(const repair::PlaybackErrorReport& report);

  std::string ManifestUrl(const std::string& session_id, const std::string& token) const;

  // Purges expired sessions from the store and releases their cache key
  // references. Returns the number of sessions removed.
  std::size_t SweepExpiredSessions();

 private:
  dashstream::v1::Quality ResolveQualityForUser(const std::string& user_id, const std::string& desired_quality);
  std::string             IssueToken(const dashstream::v1::SessionRecord& session) const;
  void                    MaybeSweepExpiredSessions();

  SessionContext                           ctx_;
  SessionOptions                           options_;
  std::unique_ptr<repair::RepairScheduler> repair_scheduler_;

  std::mutex      sweep_mutex_;
  util::TimePoint next_sweep_at_{};
};

} // namespace dashstream::session
