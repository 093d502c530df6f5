#include "mcphub/utils/scheduler.hpp"
#include "mcphub/utils/logging.hpp"

namespace mcphub {
namespace utils {

Scheduler::Scheduler() : worker_([this]() { run(); }) {}

Scheduler::~Scheduler() { shutdown(); }

Scheduler::TimerId Scheduler::scheduleAfter(std::chrono::milliseconds delay,
                                            std::function<void()> task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) {
    return kInvalidTimer;
  }
  TimerId id = next_id_++;
  auto due = Clock::now() + delay;
  queue_.emplace(std::make_pair(due, id), std::move(task));
  due_.emplace(id, due);
  cv_.notify_one();
  return id;
}

bool Scheduler::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = due_.find(id);
  if (it == due_.end()) {
    return false;
  }
  queue_.erase(std::make_pair(it->second, id));
  due_.erase(it);
  return true;
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    queue_.clear();
    due_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::size_t Scheduler::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void Scheduler::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (queue_.empty()) {
      cv_.wait(lock);
      continue;
    }

    auto next = queue_.begin();
    if (next->first.first > Clock::now()) {
      cv_.wait_until(lock, next->first.first);
      continue;
    }

    auto task = std::move(next->second);
    due_.erase(next->first.second);
    queue_.erase(next);

    lock.unlock();
    try {
      task();
    } catch (const std::exception &e) {
      MCPHUB_LOG_ERROR(std::string("Timer callback failed: ") + e.what());
    }
    lock.lock();
  }
}

} // namespace utils
} // namespace mcphub
