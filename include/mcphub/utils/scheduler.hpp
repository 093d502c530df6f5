#ifndef MCPHUB_UTILS_SCHEDULER_HPP_
#define MCPHUB_UTILS_SCHEDULER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace mcphub {
namespace utils {

/**
 * @brief One-shot timer queue served by a single worker thread
 *
 * Each connection owns one scheduler for its request deadlines and task TTLs,
 * so shutting it down cancels every timer belonging to that connection.
 * Callbacks run on the worker thread and must not call shutdown().
 */
class Scheduler {
public:
  using Clock = std::chrono::steady_clock;
  using TimerId = std::uint64_t;

  /// Returned when scheduling after shutdown.
  static constexpr TimerId kInvalidTimer = 0;

  Scheduler();
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /**
   * @brief Run a callback once after a delay
   *
   * @param delay Delay before the callback runs
   * @param task The callback
   * @return TimerId Handle for cancel(), kInvalidTimer after shutdown
   */
  TimerId scheduleAfter(std::chrono::milliseconds delay,
                        std::function<void()> task);

  /**
   * @brief Cancel a timer that has not fired yet
   *
   * @return true if the timer was pending
   */
  bool cancel(TimerId id);

  /**
   * @brief Drop every pending timer and stop the worker thread
   *
   * Idempotent. Waits for a callback that is currently running.
   */
  void shutdown();

  /**
   * @brief Number of timers waiting to fire
   */
  std::size_t pending() const;

private:
  void run();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::pair<Clock::time_point, TimerId>, std::function<void()>>
      queue_;
  std::unordered_map<TimerId, Clock::time_point> due_;
  TimerId next_id_ = 1;
  bool stopping_ = false;
  std::thread worker_;
};

} // namespace utils
} // namespace mcphub

#endif // MCPHUB_UTILS_SCHEDULER_HPP_
