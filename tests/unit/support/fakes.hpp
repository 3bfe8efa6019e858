#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "dashstream/v1.hpp"
#include "internal/db/track_repository.hpp"
#include "internal/engine/build_engine.hpp"
#include "internal/storage/asset_file_system.hpp"
#include "internal/util/time.hpp"

namespace dashstream::testing {

/*
  Manual clock. SleepFor advances virtual time and fires any action whose
  due time has been reached. With yield_on_sleep each sleep also gives other
  threads a real millisecond so concurrent waiters can interleave.
*/
class FakeClock final : public util::Clock {
 public:
  explicit FakeClock(util::TimePoint start = util::FromUnixMillis(1'700'000'000'000)) : now_(start) {
  }

  util::TimePoint Now() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return now_;
  }

  void SleepFor(std::chrono::milliseconds d) override {
    if (yield_on_sleep_) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    Advance(d);
  }

  void Advance(std::chrono::milliseconds d) {
    std::vector<std::function<void()>> due;
    {
      std::lock_guard<std::mutex> lock(mu_);
      now_ += d;
      for (auto it = scheduled_.begin(); it != scheduled_.end() && it->first <= now_;) {
        due.push_back(std::move(it->second));
        it = scheduled_.erase(it);
      }
    }
    for (auto& action : due) {
      action();
    }
  }

  // Runs `action` once virtual time reaches start + offset.
  void At(std::chrono::milliseconds offset, std::function<void()> action) {
    std::lock_guard<std::mutex> lock(mu_);
    scheduled_.emplace(start_ + offset, std::move(action));
  }

  // Re-bases At() offsets on the current time.
  void MarkStart() {
    std::lock_guard<std::mutex> lock(mu_);
    start_ = now_;
  }

  void set_yield_on_sleep(bool yield) {
    yield_on_sleep_ = yield;
  }

 private:
  mutable std::mutex                                      mu_;
  util::TimePoint                                         now_;
  util::TimePoint                                         start_ = now_;
  std::multimap<util::TimePoint, std::function<void()>>   scheduled_;
  std::atomic<bool>                                       yield_on_sleep_{false};
};

class FakeAssetFileSystem final : public storage::AssetFileSystem {
 public:
  bool Exists(const std::filesystem::path& path) const override {
    std::lock_guard<std::mutex> lock(mu_);
    ++exists_calls_[path.lexically_normal().string()];
    return files_.count(path.lexically_normal().string()) > 0;
  }

  std::optional<std::string> ReadFile(const std::filesystem::path& path) const override {
    std::lock_guard<std::mutex> lock(mu_);
    ++read_calls_[path.lexically_normal().string()];
    auto it = files_.find(path.lexically_normal().string());
    if (it == files_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void Put(const std::filesystem::path& path, std::string content = "") {
    std::lock_guard<std::mutex> lock(mu_);
    files_[path.lexically_normal().string()] = std::move(content);
  }

  void Remove(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mu_);
    files_.erase(path.lexically_normal().string());
  }

  int ExistsCalls(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = exists_calls_.find(path.lexically_normal().string());
    return it == exists_calls_.end() ? 0 : it->second;
  }

  int ReadCalls(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = read_calls_.find(path.lexically_normal().string());
    return it == read_calls_.end() ? 0 : it->second;
  }

 private:
  mutable std::mutex                 mu_;
  std::map<std::string, std::string> files_;
  mutable std::map<std::string, int> exists_calls_;
  mutable std::map<std::string, int> read_calls_;
};

class FakeBuildEngine final : public engine::BuildEngine {
 public:
  explicit FakeBuildEngine(std::filesystem::path output_root = "/assets") : output_root_(std::move(output_root)) {
  }

  dashstream::v1::DashAsset EnsureLocalDashSegments(const dashstream::v1::DashBuildRequest& request) override {
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++ensure_calls_;
      last_request_ = request;
      if (report_in_flight_after_ensure_) {
        in_flight_ = true;
      }
      if (ensure_error_) {
        throw std::runtime_error(*ensure_error_);
      }
      hook = on_ensure_;
    }
    if (hook) {
      hook();
    }

    const auto key = CacheKeyFor(request.track_id(), request.quality());
    dashstream::v1::DashAsset asset;
    asset.set_cache_key(key);
    asset.set_output_dir((output_root_ / key).string());
    asset.set_manifest_path((output_root_ / key / "manifest.mpd").string());
    return asset;
  }

  bool HasInFlightBuild(const std::string&) override {
    std::lock_guard<std::mutex> lock(mu_);
    return in_flight_ && !distributed_;
  }

  dashstream::v1::BuildInFlightStatus GetBuildInFlightStatus(const std::string&) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++status_calls_;
    dashstream::v1::BuildInFlightStatus status;
    status.set_local_in_flight(in_flight_ && !distributed_);
    status.set_distributed_in_flight(in_flight_ && distributed_);
    status.set_in_flight(in_flight_);
    return status;
  }

  std::optional<engine::BuildFailure> GetBuildFailure(const std::string&) override {
    std::lock_guard<std::mutex> lock(mu_);
    return failure_;
  }

  bool IsCacheMarkedInvalid(const std::string& cache_key) override {
    std::lock_guard<std::mutex> lock(mu_);
    return invalid_.count(cache_key) > 0;
  }

  void ForceRegenerateDashSegments(const dashstream::v1::DashBuildRequest& request) override {
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++regenerate_calls_;
      last_request_ = request;
      if (regenerate_error_) {
        throw std::runtime_error(*regenerate_error_);
      }
      hook = on_regenerate_;
    }
    if (hook) {
      hook();
    }
  }

  static std::string CacheKeyFor(const std::string& track_id, dashstream::v1::Quality quality) {
    return track_id + "-q" + std::to_string(static_cast<int>(quality));
  }

  void SetFailure(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mu_);
    failure_ = message ? std::optional<engine::BuildFailure>(engine::BuildFailure{*message}) : std::nullopt;
  }

  void SetInFlight(bool in_flight, bool distributed = false) {
    std::lock_guard<std::mutex> lock(mu_);
    in_flight_   = in_flight;
    distributed_ = distributed;
  }

  void ReportInFlightAfterEnsure(bool value) {
    std::lock_guard<std::mutex> lock(mu_);
    report_in_flight_after_ensure_ = value;
  }

  void MarkInvalid(const std::string& cache_key, bool invalid) {
    std::lock_guard<std::mutex> lock(mu_);
    if (invalid) {
      invalid_.insert(cache_key);
    } else {
      invalid_.erase(cache_key);
    }
  }

  void OnEnsure(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mu_);
    on_ensure_ = std::move(hook);
  }

  void OnRegenerate(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mu_);
    on_regenerate_ = std::move(hook);
  }

  void FailEnsure(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mu_);
    ensure_error_ = std::move(message);
  }

  void FailRegenerate(std::optional<std::string> message) {
    std::lock_guard<std::mutex> lock(mu_);
    regenerate_error_ = std::move(message);
  }

  int ensure_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ensure_calls_;
  }

  int regenerate_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return regenerate_calls_;
  }

  int status_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return status_calls_;
  }

  dashstream::v1::DashBuildRequest last_request() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_request_;
  }

 private:
  mutable std::mutex                  mu_;
  std::filesystem::path               output_root_;
  std::optional<engine::BuildFailure> failure_;
  std::set<std::string>               invalid_;
  bool                                in_flight_                     = false;
  bool                                distributed_                   = false;
  bool                                report_in_flight_after_ensure_ = false;
  std::optional<std::string>          ensure_error_;
  std::optional<std::string>          regenerate_error_;
  std::function<void()>               on_ensure_;
  std::function<void()>               on_regenerate_;
  int                                 ensure_calls_     = 0;
  int                                 regenerate_calls_ = 0;
  int                                 status_calls_     = 0;
  dashstream::v1::DashBuildRequest    last_request_;
};

class FakeTrackRepository final : public db::TrackRepository {
 public:
  std::optional<db::TrackSource> FindTrackSource(const std::string& track_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++lookups_;
    if (fail_lookups_) {
      throw std::runtime_error("track store unavailable");
    }
    auto it = tracks_.find(track_id);
    if (it == tracks_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<std::string> FindPlaybackQuality(const std::string& user_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = qualities_.find(user_id);
    if (it == qualities_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void AddTrack(const std::string& track_id, std::string file_path) {
    std::lock_guard<std::mutex> lock(mu_);
    tracks_[track_id] = db::TrackSource{std::move(file_path), util::FromUnixMillis(1'600'000'000'000)};
  }

  void SetPlaybackQuality(const std::string& user_id, std::string quality) {
    std::lock_guard<std::mutex> lock(mu_);
    qualities_[user_id] = std::move(quality);
  }

  void FailLookups(bool fail) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_lookups_ = fail;
  }

  int lookups() const {
    std::lock_guard<std::mutex> lock(mu_);
    return lookups_;
  }

 private:
  mutable std::mutex                        mu_;
  std::map<std::string, db::TrackSource>    tracks_;
  std::map<std::string, std::string>        qualities_;
  bool                                      fail_lookups_ = false;
  int                                       lookups_      = 0;
};

/*
  Minimal MPD. One AdaptationSet per entry of `timeline_entries`, one
  Representation each; every representation gets a single <S> with the
  given number of entries expressed through r.
*/
inline std::string MakeManifest(const std::vector<std::size_t>& timeline_entries) {
  std::string xml = R"(<?xml version="1.0" encoding="utf-8"?>
<MPD xmlns="urn:mpeg:dash:schema:mpd:2011" type="static" mediaPresentationDuration="PT3M0S">
  <Period id="0" start="PT0S">
)";
  for (std::size_t i = 0; i < timeline_entries.size(); ++i) {
    xml += "    <AdaptationSet id=\"" + std::to_string(i) + "\" contentType=\"audio\">\n";
    xml += "      <Representation id=\"" + std::to_string(i) + "\" bandwidth=\"320000\">\n";
    xml += "        <SegmentTemplate timescale=\"48000\" initialization=\"init-$RepresentationID$.m4s\" "
           "media=\"chunk-$RepresentationID$-$Number%05d$.m4s\" startNumber=\"1\">\n";
    xml += "          <SegmentTimeline>\n";
    if (timeline_entries[i] > 0) {
      xml += "            <S t=\"0\" d=\"96000\" r=\"" + std::to_string(timeline_entries[i] - 1) + "\"/>\n";
    }
    xml += "          </SegmentTimeline>\n";
    xml += "        </SegmentTemplate>\n";
    xml += "      </Representation>\n";
    xml += "    </AdaptationSet>\n";
  }
  xml += "  </Period>\n</MPD>\n";
  return xml;
}

} // namespace dashstream::testing
