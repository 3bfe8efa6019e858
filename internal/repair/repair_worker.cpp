#include "repair_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace dashstream::repair {

RepairWorker::RepairWorker(std::size_t threads) : thread_count_(threads == 0 ? 1 : threads) {
}

RepairWorker::~RepairWorker() {
  Stop();
}

void RepairWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&RepairWorker::Run, this);
  }
}

void RepairWorker::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

bool RepairWorker::Post(RepairTask task) {
  if (!queue_.Enqueue(std::move(task))) {
    DASHSTREAM_LOG_WARN("repair task dropped, worker stopped");
    return false;
  }
  return true;
}

void RepairWorker::WaitForIdle() {
  // nothing would ever drain the queue
  if (!running_) {
    return;
  }
  queue_.WaitForIdle();
}

void RepairWorker::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) {
      break;
    }

    try {
      (*task)();
    } catch (const std::exception& e) {
      DASHSTREAM_LOG_ERROR("repair task failed", {observability::StringField("error", e.what())});
    }
    queue_.TaskDone();
  }
}

} // namespace dashstream::repair
