#ifndef MCPHUB_SESSION_TASK_COORDINATOR_HPP_
#define MCPHUB_SESSION_TASK_COORDINATOR_HPP_

#include "mcphub/session/progress_tracker.hpp"
#include "mcphub/types.hpp"
#include "mcphub/utils/scheduler.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace mcphub {
namespace session {

/**
 * @brief Whether the task state machine allows a status change
 *
 * working -> input_required | completed | failed | cancelled
 * input_required -> working | completed | failed | cancelled
 * Terminal statuses allow nothing, and no status transitions to itself.
 */
bool canTransition(types::TaskStatus from, types::TaskStatus to);

/**
 * @brief How InitiatorTaskCoordinator::awaitResult waits
 */
struct TaskWaitOptions {
  /// Overall bound, independent of request deadlines and the poll interval.
  std::chrono::milliseconds timeout{std::chrono::minutes(5)};
  /// Used when the peer did not suggest a poll interval.
  std::chrono::milliseconds default_poll_interval{1000};
  /// Called on every observed status change.
  std::function<void(const types::TaskDescriptor &)> on_status;
  /// Called once per entry into input_required.
  std::function<void(const types::TaskDescriptor &)> on_input_required;
  /// Stops the wait and cancels the task.
  std::stop_token stop_token;
};

/**
 * @brief Tracks tasks the peer runs on our behalf
 *
 * Records are created from a CreateTaskResult, updated by pushed status
 * notifications or by polling tasks/get, and removed once the result was
 * fetched, the task failed or was cancelled, its TTL ran out or the
 * connection closed.
 */
class InitiatorTaskCoordinator {
public:
  /// Blocking request to the peer; throws on any failure.
  using Requester = std::function<nlohmann::json(const std::string &method,
                                                 const nlohmann::json &params)>;

  InitiatorTaskCoordinator(Requester requester, ProgressTracker &progress,
                           utils::Scheduler &scheduler, std::string label);
  ~InitiatorTaskCoordinator();

  InitiatorTaskCoordinator(const InitiatorTaskCoordinator &) = delete;
  InitiatorTaskCoordinator &
  operator=(const InitiatorTaskCoordinator &) = delete;

  /**
   * @brief Start tracking a task created by the peer
   *
   * @param task The descriptor from the CreateTaskResult
   * @param progress_token Token of the originating request, re-bound to the
   * task
   */
  void track(const types::TaskDescriptor &task,
             std::optional<std::string> progress_token = std::nullopt);

  /**
   * @brief Apply a status update from a push or a poll
   *
   * Illegal transitions are logged and ignored.
   *
   * @param update The peer's descriptor
   * @param pushed True for notifications/tasks/status
   * @return true if the update was applied
   */
  bool applyStatus(const types::TaskDescriptor &update, bool pushed);

  /**
   * @brief Wait for a task to finish and return its result
   *
   * @param task_id The task
   * @param options Timeout, polling and input handling
   * @return nlohmann::json The payload of tasks/result
   * @throws TaskFailedException, CancelledException, TimeoutException,
   * InputRequiredException, TaskNotFoundException
   */
  nlohmann::json awaitResult(const std::string &task_id,
                             const TaskWaitOptions &options = {});

  /**
   * @brief Refresh a task with tasks/get
   */
  types::TaskDescriptor get(const std::string &task_id);

  /**
   * @brief Fetch the deferred result with tasks/result
   *
   * A tracked task may only be fetched once; the record is dropped
   * afterwards.
   */
  nlohmann::json result(const std::string &task_id);

  /**
   * @brief Cancel a task with tasks/cancel and stop tracking it
   *
   * @throws InvalidTaskTransitionException if the task is already terminal
   * locally; nothing is sent in that case
   */
  types::TaskDescriptor cancel(const std::string &task_id);

  /**
   * @brief List the peer's tasks, the cursor is passed through unchanged
   */
  types::ListTasksResult
  list(const std::optional<std::string> &cursor = std::nullopt);

  /**
   * @brief Local view of a tracked task
   */
  std::optional<types::TaskDescriptor> local(const std::string &task_id) const;

  std::size_t size() const;

  /**
   * @brief Mark every tracked task failed and drop all records
   */
  void failAll(const std::string &reason);

private:
  struct Record {
    types::TaskDescriptor descriptor;
    std::optional<std::string> progress_token;
    bool push_observed = false;
    bool result_claimed = false;
    std::uint64_t version = 0;
    std::optional<std::uint64_t> input_signalled;
    utils::Scheduler::TimerId ttl_timer = utils::Scheduler::kInvalidTimer;
  };

  std::shared_ptr<Record> find(const std::string &task_id) const;
  void finish(const std::string &task_id, const std::shared_ptr<Record> &rec);
  void expire(const std::string &task_id);
  static const nlohmann::json &descriptorBody(const nlohmann::json &result);

  Requester requester_;
  ProgressTracker &progress_;
  utils::Scheduler &scheduler_;
  std::string label_;

  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::map<std::string, std::shared_ptr<Record>> tasks_;
};

/**
 * @brief Retention and paging settings for tasks we run for the peer
 */
struct ReceiverTaskConfig {
  std::chrono::milliseconds default_ttl{std::chrono::minutes(10)};
  std::chrono::milliseconds max_ttl{std::chrono::hours(1)};
  std::chrono::milliseconds poll_interval{1000};
  bool purge_on_result = true; ///< Drop the record after the first result
  std::size_t page_size = 50;
};

/**
 * @brief Runs the task state machine for requests the peer sent as tasks
 *
 * Every lookup from the peer carries the scope of the session that created
 * the task; tasks of other scopes are reported as not found.
 */
class ReceiverTaskCoordinator {
public:
  using StatusNotifier = std::function<void(const types::TaskDescriptor &)>;

  ReceiverTaskCoordinator(utils::Scheduler &scheduler, StatusNotifier notifier,
                          ReceiverTaskConfig config, std::string label);
  ~ReceiverTaskCoordinator();

  ReceiverTaskCoordinator(const ReceiverTaskCoordinator &) = delete;
  ReceiverTaskCoordinator &operator=(const ReceiverTaskCoordinator &) = delete;

  /**
   * @brief Create a task in the working status
   *
   * @param scope Session the task belongs to
   * @param metadata The params.task of the request
   * @param work If set, receives the task's work token (see workToken)
   * @return types::TaskDescriptor The new task
   */
  types::TaskDescriptor create(const std::string &scope,
                               const types::TaskMetadata &metadata,
                               std::stop_token *work = nullptr);

  /**
   * @brief Token stopped when the task is cancelled, expires or the
   * connection closes
   */
  std::stop_token workToken(const std::string &task_id) const;

  /**
   * @brief Move a task to a new status and notify the peer
   *
   * Setting the current status again only replaces the message.
   *
   * @throws InvalidTaskTransitionException, TaskNotFoundException
   */
  void transition(const std::string &task_id, types::TaskStatus to,
                  std::optional<std::string> message = std::nullopt);

  /**
   * @brief Complete a task with its result payload
   */
  void complete(const std::string &task_id, nlohmann::json result);

  /**
   * @brief Fail a task, the error is what tasks/result reports
   */
  void fail(const std::string &task_id, const types::ErrorData &error);

  /**
   * @brief Serve tasks/get
   */
  types::TaskDescriptor get(const std::string &task_id,
                            const std::string &scope);

  /**
   * @brief Serve tasks/result, blocking until the task is terminal
   *
   * @param timeout Upper bound for the wait
   * @param stop Stopped when the peer cancels the request
   * @throws TimeoutException, CancelledException, TaskNotFoundException, or
   * the error the task failed with
   */
  nlohmann::json result(const std::string &task_id, const std::string &scope,
                        std::chrono::milliseconds timeout,
                        std::stop_token stop = {});

  /**
   * @brief Serve tasks/list, ordered by creation
   *
   * @throws ProtocolException for a cursor this coordinator did not issue
   */
  types::ListTasksResult
  list(const std::string &scope,
       const std::optional<std::string> &cursor = std::nullopt);

  /**
   * @brief Serve tasks/cancel
   *
   * @throws InvalidTaskTransitionException if the task is terminal
   */
  types::TaskDescriptor cancel(const std::string &task_id,
                               const std::string &scope);

  /**
   * @brief Fail every task and drop all records
   */
  void failAll(const std::string &reason);

  std::size_t size() const;

private:
  using Clock = std::chrono::steady_clock;

  struct Record {
    types::TaskDescriptor descriptor;
    std::string scope;
    std::uint64_t sequence = 0;
    Clock::time_point expires_at;
    std::optional<nlohmann::json> result;
    std::optional<types::ErrorData> error;
    std::stop_source work;
    utils::Scheduler::TimerId ttl_timer = utils::Scheduler::kInvalidTimer;
    bool purged = false;
  };

  std::shared_ptr<Record> lookupLocked(const std::string &task_id,
                                       const std::string *scope);
  types::TaskDescriptor applyLocked(Record &rec, types::TaskStatus to,
                                    std::optional<std::string> message);
  void removeLocked(const std::string &task_id, Record &rec);
  void purge(const std::string &task_id);
  void publish(const types::TaskDescriptor &descriptor);

  utils::Scheduler &scheduler_;
  StatusNotifier notifier_;
  ReceiverTaskConfig config_;
  std::string label_;

  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  std::map<std::string, std::shared_ptr<Record>> tasks_;
  std::map<std::uint64_t, std::string> order_;
  std::uint64_t next_sequence_ = 1;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_TASK_COORDINATOR_HPP_
