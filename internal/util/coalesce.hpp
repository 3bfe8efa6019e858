#pragma once

#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace dashstream::util {

/*
  InFlightMap

  key -> in-flight operation. At most one operation runs per key; concurrent
  callers for the same key share its outcome.

  Entries are tagged with a monotonically increasing id so a settling
  operation only removes the entry it inserted, never a newer one installed
  for the same key.
*/
template <typename T>
class InFlightMap {
 public:
  using Future = std::shared_future<T>;

  struct Claim {
    Future                          future;
    std::shared_ptr<std::promise<T>> promise; // null when the caller joined an existing entry
    uint64_t                        entry_id = 0;
  };

  // Joins the entry under `key` or inserts a fresh one owned by the caller.
  Claim Acquire(const std::string& key) {
    std::lock_guard lock(mutex_);

    if (auto it = entries_.find(key); it != entries_.end()) {
      return {it->second.future, nullptr, it->second.id};
    }

    Claim claim;
    claim.promise  = std::make_shared<std::promise<T>>();
    claim.future   = claim.promise->get_future().share();
    claim.entry_id = ++next_id_;
    entries_.emplace(key, Entry{claim.entry_id, claim.future});
    return claim;
  }

  // Removes `key` only when it still maps to `entry_id`.
  bool ReleaseIfCurrent(const std::string& key, uint64_t entry_id) {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.id != entry_id) {
      return false;
    }
    entries_.erase(it);
    return true;
  }

  bool Contains(const std::string& key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(key) > 0;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
  }

 private:
  struct Entry {
    uint64_t id;
    Future   future;
  };

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t                               next_id_ = 0;
};

/*
  Coalesce

  Runs `factory` for `key` unless an operation for `key` is already in flight,
  in which case the caller joins it. The entry is inserted before the factory
  starts and released before the outcome is published, so a caller arriving
  after settlement always starts a fresh operation.

  `executor` receives a nullary task; pass an inline executor to run on the
  calling thread or a queue poster to run in the background. An executor
  returning bool reports whether it accepted the task; a rejected task
  releases its entry and fails the shared future.
*/
template <typename T, typename Factory, typename Executor>
std::shared_future<T> Coalesce(InFlightMap<T>& map, const std::string& key, Factory factory, Executor&& executor) {
  auto claim = map.Acquire(key);
  if (!claim.promise) {
    return claim.future;
  }

  auto       future   = claim.future;
  auto       promise  = claim.promise;
  const auto entry_id = claim.entry_id;

  auto task = [&map, key, claim = std::move(claim), factory = std::move(factory)]() mutable {
    std::exception_ptr error;
    if constexpr (std::is_void_v<T>) {
      try {
        factory();
      } catch (...) {
        error = std::current_exception();
      }
      map.ReleaseIfCurrent(key, claim.entry_id);
      if (error) {
        claim.promise->set_exception(error);
      } else {
        claim.promise->set_value();
      }
    } else {
      std::optional<T> value;
      try {
        value.emplace(factory());
      } catch (...) {
        error = std::current_exception();
      }
      map.ReleaseIfCurrent(key, claim.entry_id);
      if (error) {
        claim.promise->set_exception(error);
      } else {
        claim.promise->set_value(std::move(*value));
      }
    }
  };

  if constexpr (std::is_same_v<std::invoke_result_t<Executor&, decltype(task)>, bool>) {
    if (!executor(std::move(task))) {
      map.ReleaseIfCurrent(key, entry_id);
      promise->set_exception(std::make_exception_ptr(std::runtime_error("operation for " + key + " was not scheduled")));
    }
  } else {
    executor(std::move(task));
  }
  return future;
}

template <typename T, typename Factory>
std::shared_future<T> Coalesce(InFlightMap<T>& map, const std::string& key, Factory factory) {
  return Coalesce(map, key, std::move(factory), [](auto&& task) { task(); });
}

} // namespace dashstream::util
