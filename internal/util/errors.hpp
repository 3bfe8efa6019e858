#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dashstream::util {

/*
  Central error types.

  Every streaming error carries a machine readable code plus the HTTP status
  the consuming layer should answer with (see internal/http/error_mapping).
*/

class StreamingError : public std::runtime_error {
 public:
  StreamingError(const std::string& msg, int status_code, std::string code)
      : std::runtime_error(msg), status_code_(status_code), code_(std::move(code)) {
  }

  int status_code() const noexcept {
    return status_code_;
  }

  const std::string& code() const noexcept {
    return code_;
  }

 private:
  int         status_code_;
  std::string code_;
};

// Deadline elapsed before the asset became ready. Transient.
class AssetNotReady : public StreamingError {
 public:
  explicit AssetNotReady(const std::string& msg) : StreamingError(msg, 503, "STREAMING_ASSET_NOT_READY") {
  }
};

// Build engine recorded a terminal failure for the cache key.
class AssetBuildFailed : public StreamingError {
 public:
  explicit AssetBuildFailed(const std::string& msg) : StreamingError(msg, 502, "STREAMING_ASSET_BUILD_FAILED") {
  }
};

class SessionTokenRequired : public StreamingError {
 public:
  explicit SessionTokenRequired(const std::string& msg) : StreamingError(msg, 401, "STREAMING_SESSION_TOKEN_REQUIRED") {
  }
};

class SessionTokenInvalid : public StreamingError {
 public:
  explicit SessionTokenInvalid(const std::string& msg) : StreamingError(msg, 401, "STREAMING_SESSION_TOKEN_INVALID") {
  }
};

class SessionTokenExpired : public StreamingError {
 public:
  explicit SessionTokenExpired(const std::string& msg) : StreamingError(msg, 401, "STREAMING_SESSION_TOKEN_EXPIRED") {
  }
};

class SessionTokenScopeMismatch : public StreamingError {
 public:
  explicit SessionTokenScopeMismatch(const std::string& msg) : StreamingError(msg, 403, "STREAMING_SESSION_TOKEN_SCOPE_MISMATCH") {
  }
};

class TrackNotFound : public StreamingError {
 public:
  explicit TrackNotFound(const std::string& msg) : StreamingError(msg, 404, "TRACK_NOT_FOUND") {
  }
};

class TrackNotLocallyAvailable : public StreamingError {
 public:
  explicit TrackNotLocallyAvailable(const std::string& msg) : StreamingError(msg, 404, "TRACK_NOT_LOCALLY_AVAILABLE") {
  }
};

class TrackSourceMissing : public StreamingError {
 public:
  explicit TrackSourceMissing(const std::string& msg) : StreamingError(msg, 404, "TRACK_SOURCE_MISSING") {
  }
};

class InvalidSegmentName : public StreamingError {
 public:
  explicit InvalidSegmentName(const std::string& msg) : StreamingError(msg, 400, "INVALID_SEGMENT_NAME") {
  }
};

class InvalidSegmentPath : public StreamingError {
 public:
  explicit InvalidSegmentPath(const std::string& msg) : StreamingError(msg, 400, "INVALID_SEGMENT_PATH") {
  }
};

} // namespace dashstream::util
