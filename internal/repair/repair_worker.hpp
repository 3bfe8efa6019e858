#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "internal/repair/repair_queue.hpp"

namespace dashstream::repair {

/*
  Background pool that runs playback-error repairs off the request path.

  Stop drains queued tasks before joining.
*/
class RepairWorker {
 public:
  explicit RepairWorker(std::size_t threads = 1);
  ~RepairWorker();

  RepairWorker(const RepairWorker&)            = delete;
  RepairWorker& operator=(const RepairWorker&) = delete;

  void Start();
  void Stop();

  // false when the worker is stopped and the task was dropped
  bool Post(RepairTask task);

  // Blocks until nothing is queued or running.
  void WaitForIdle();

 private:
  void Run();

  std::size_t              thread_count_;
  RepairQueue              queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace dashstream::repair
