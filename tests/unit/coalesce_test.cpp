#include "internal/util/coalesce.hpp"

#include <cassert>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using dashstream::util::Coalesce;
using dashstream::util::InFlightMap;

// Executor that parks tasks until the test releases them.
class DeferredExecutor {
 public:
  void operator()(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(task));
  }

  void RunAll() {
    std::vector<std::function<void()>> tasks;
    {
      std::lock_guard<std::mutex> lock(mu_);
      tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
      task();
    }
  }

  std::size_t Pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
  }

 private:
  mutable std::mutex                 mu_;
  std::vector<std::function<void()>> tasks_;
};

void TestConcurrentCallersShareOneRun() {
  InFlightMap<int> map;
  DeferredExecutor executor;
  int              runs = 0;

  auto first  = Coalesce(map, "sess-1", [&runs] { return ++runs; }, std::ref(executor));
  auto second = Coalesce(map, "sess-1", [&runs] { return ++runs; }, std::ref(executor));

  assert(executor.Pending() == 1);
  assert(map.Contains("sess-1"));

  executor.RunAll();

  assert(first.get() == 1);
  assert(second.get() == 1);
  assert(runs == 1);
  assert(!map.Contains("sess-1"));
}

void TestSequentialCallersStartFreshRuns() {
  InFlightMap<int> map;
  int              runs = 0;

  assert(Coalesce(map, "sess-1", [&runs] { return ++runs; }).get() == 1);
  assert(Coalesce(map, "sess-1", [&runs] { return ++runs; }).get() == 2);
  assert(map.Size() == 0);
}

void TestDistinctKeysDoNotShare() {
  InFlightMap<int> map;
  DeferredExecutor executor;

  auto a = Coalesce(map, "sess-a", [] { return 1; }, std::ref(executor));
  auto b = Coalesce(map, "sess-b", [] { return 2; }, std::ref(executor));
  assert(executor.Pending() == 2);

  executor.RunAll();
  assert(a.get() == 1);
  assert(b.get() == 2);
}

void TestFailureReachesEveryJoinerAndReleasesEntry() {
  InFlightMap<void> map;
  DeferredExecutor  executor;

  auto first  = Coalesce(map, "sess-1", [] { throw std::runtime_error("boom"); }, std::ref(executor));
  auto second = Coalesce(map, "sess-1", [] {}, std::ref(executor));
  executor.RunAll();

  int failures = 0;
  for (auto* f : {&first, &second}) {
    try {
      f->get();
    } catch (const std::runtime_error& e) {
      assert(std::string(e.what()) == "boom");
      ++failures;
    }
  }
  assert(failures == 2);
  assert(!map.Contains("sess-1"));

  // a failed run does not poison the key
  bool ran = false;
  Coalesce(map, "sess-1", [&ran] { ran = true; }).get();
  assert(ran);
}

void TestRejectedTaskReleasesEntry() {
  InFlightMap<int> map;

  auto rejected = Coalesce(map, "sess-1", [] { return 1; }, [](auto&&) { return false; });
  assert(map.Size() == 0);
  bool threw = false;
  try {
    (void)rejected.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto accepted = Coalesce(map, "sess-1", [] { return 2; }, [](auto&& task) {
    task();
    return true;
  });
  assert(accepted.get() == 2);
  assert(map.Size() == 0);
}

void TestStaleReleaseKeepsNewerEntry() {
  InFlightMap<int> map;

  auto older = map.Acquire("sess-1");
  assert(older.promise);
  assert(map.ReleaseIfCurrent("sess-1", older.entry_id));

  auto newer = map.Acquire("sess-1");
  assert(newer.entry_id != older.entry_id);

  assert(!map.ReleaseIfCurrent("sess-1", older.entry_id));
  assert(map.Contains("sess-1"));
  assert(map.ReleaseIfCurrent("sess-1", newer.entry_id));
}

void TestManyThreadsJoinSingleBackgroundRun() {
  InFlightMap<int>        map;
  std::atomic<int>        runs{0};
  std::mutex              gate_mu;
  std::condition_variable gate_cv;
  bool                    open = false;

  std::vector<std::thread> background;
  auto                     executor = [&background](std::function<void()> task) { background.emplace_back(std::move(task)); };

  auto factory = [&] {
    std::unique_lock<std::mutex> lock(gate_mu);
    gate_cv.wait(lock, [&] { return open; });
    return ++runs;
  };

  std::vector<std::shared_future<int>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(Coalesce(map, "sess-1", factory, executor));
  }
  assert(background.size() == 1);

  {
    std::lock_guard<std::mutex> lock(gate_mu);
    open = true;
  }
  gate_cv.notify_all();

  for (auto& f : futures) {
    assert(f.get() == 1);
  }
  for (auto& t : background) {
    t.join();
  }
  assert(runs.load() == 1);
}

} // namespace

int main() {
  TestConcurrentCallersShareOneRun();
  TestSequentialCallersStartFreshRuns();
  TestDistinctKeysDoNotShare();
  TestFailureReachesEveryJoinerAndReleasesEntry();
  TestRejectedTaskReleasesEntry();
  TestStaleReleaseKeepsNewerEntry();
  TestManyThreadsJoinSingleBackgroundRun();

  std::cout << "dashstream_unit_coalesce: pass\n";
  return 0;
}
