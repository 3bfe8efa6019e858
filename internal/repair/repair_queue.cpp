#include "repair_queue.hpp"

#include <utility>

namespace dashstream::repair {

bool RepairQueue::Enqueue(RepairTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return false;
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<RepairTask> RepairQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }

  RepairTask task = std::move(queue_.front());
  queue_.pop();
  ++running_;
  return task;
}

void RepairQueue::TaskDone() {
  {
    std::lock_guard lock(mutex_);
    if (running_ > 0) {
      --running_;
    }
  }
  idle_cv_.notify_all();
}

void RepairQueue::WaitForIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return queue_.empty() && running_ == 0; });
}

void RepairQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t RepairQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size() + running_;
}

} // namespace dashstream::repair
