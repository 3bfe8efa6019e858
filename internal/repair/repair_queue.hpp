#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace dashstream::repair {

using RepairTask = std::function<void()>;

/*
  Thread-safe blocking queue for repair workers.

  Tracks tasks that were dequeued but not yet reported done so callers can
  wait for the queue to go fully idle.
*/
class RepairQueue {
 public:
  // false once shut down
  bool Enqueue(RepairTask task);

  // blocking wait; nullopt after shutdown once drained
  std::optional<RepairTask> Dequeue();

  void TaskDone();

  void WaitForIdle();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::queue<RepairTask>  queue_;
  std::size_t             running_  = 0;
  bool                    shutdown_ = false;
};

} // namespace dashstream::repair
