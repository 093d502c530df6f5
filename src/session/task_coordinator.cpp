#include "mcphub/session/task_coordinator.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/ids.hpp"
#include "mcphub/utils/json_utils.hpp"
#include "mcphub/utils/logging.hpp"

#include <algorithm>
#include <vector>

namespace mcphub {
namespace session {

using types::TaskStatus;

namespace {

// Lower bound for polling, whatever the peer or the caller asks for
constexpr std::chrono::milliseconds kMinPollInterval{5};

} // namespace

bool canTransition(TaskStatus from, TaskStatus to) {
  if (from == to || types::isTerminal(from)) {
    return false;
  }
  if (from == TaskStatus::Working) {
    return to != TaskStatus::Working;
  }
  // input_required
  return to != TaskStatus::InputRequired;
}

// --- InitiatorTaskCoordinator ----------------------------------------------

InitiatorTaskCoordinator::InitiatorTaskCoordinator(Requester requester,
                                                   ProgressTracker &progress,
                                                   utils::Scheduler &scheduler,
                                                   std::string label)
    : requester_(std::move(requester)), progress_(progress),
      scheduler_(scheduler), label_(std::move(label)) {}

InitiatorTaskCoordinator::~InitiatorTaskCoordinator() {
  failAll("Connection closed");
}

const nlohmann::json &
InitiatorTaskCoordinator::descriptorBody(const nlohmann::json &result) {
  if (result.contains("task") && result["task"].is_object()) {
    return result["task"];
  }
  return result;
}

void InitiatorTaskCoordinator::track(const types::TaskDescriptor &task,
                                     std::optional<std::string> progress_token) {
  auto rec = std::make_shared<Record>();
  rec->descriptor = task;
  rec->progress_token = progress_token;

  // The peer drops the task after its TTL, so do we
  if (task.ttl && *task.ttl > 0) {
    const std::string task_id = task.taskId;
    rec->ttl_timer =
        scheduler_.scheduleAfter(std::chrono::milliseconds(*task.ttl),
                                 [this, task_id]() { expire(task_id); });
  }

  // Replace any stale record with the same id
  std::shared_ptr<Record> replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &slot = tasks_[task.taskId];
    replaced = std::move(slot);
    slot = rec;
  }
  if (replaced) {
    MCPHUB_LOG_WARNING("[" + label_ + "] Task " + task.taskId +
                       " was already tracked");
    scheduler_.cancel(replaced->ttl_timer);
  }
  // Progress of the originating request now belongs to the task
  if (progress_token) {
    progress_.rebind(*progress_token,
                     {ProgressOwner::Kind::Task, task.taskId});
  }
  MCPHUB_LOG_DEBUG("[" + label_ + "] Tracking task " + task.taskId + " (" +
                   types::toString(task.status) + ")");
}

bool InitiatorTaskCoordinator::applyStatus(const types::TaskDescriptor &update,
                                           bool pushed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(update.taskId);
  if (it == tasks_.end()) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] Status for unknown task " +
                     update.taskId);
    return false;
  }

  Record &rec = *it->second;
  if (pushed) {
    rec.push_observed = true;
  }

  // Reject transitions the state machine does not allow
  const TaskStatus current = rec.descriptor.status;
  if (update.status != current && !canTransition(current, update.status)) {
    MCPHUB_LOG_WARNING("[" + label_ + "] Ignoring transition of task " +
                       update.taskId + " from " + types::toString(current) +
                       " to " + types::toString(update.status));
    return false;
  }

  const bool changed = update.status != current ||
                       update.statusMessage != rec.descriptor.statusMessage;
  rec.descriptor.status = update.status;
  rec.descriptor.statusMessage = update.statusMessage;
  if (update.pollInterval) {
    rec.descriptor.pollInterval = update.pollInterval;
  }
  if (update.lastUpdatedAt) {
    rec.descriptor.lastUpdatedAt = update.lastUpdatedAt;
  }
  if (changed) {
    ++rec.version;
  }
  cv_.notify_all();
  return true;
}

nlohmann::json
InitiatorTaskCoordinator::awaitResult(const std::string &task_id,
                                      const TaskWaitOptions &options) {
  auto rec = find(task_id);
  if (!rec) {
    throw TaskNotFoundException(task_id);
  }

  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  std::optional<std::uint64_t> reported;
  std::unique_lock<std::mutex> lock(mutex_);

  while (true) {
    // Report every version once, outside the lock
    if (options.on_status && reported != rec->version) {
      reported = rec->version;
      auto snapshot = rec->descriptor;
      lock.unlock();
      options.on_status(snapshot);
      lock.lock();
      continue;
    }

    const TaskStatus status = rec->descriptor.status;
    if (types::isTerminal(status)) {
      break;
    }

    // Hand input_required to the caller once per entry into it
    if (status == TaskStatus::InputRequired &&
        rec->input_signalled != rec->version) {
      rec->input_signalled = rec->version;
      auto snapshot = rec->descriptor;
      lock.unlock();
      if (!options.on_input_required) {
        throw InputRequiredException(
            task_id, snapshot.statusMessage.value_or("Task requires input"));
      }
      options.on_input_required(snapshot);
      lock.lock();
      continue;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw TimeoutException("Timed out waiting for task " + task_id,
                             {{"taskId", task_id},
                              {"timeout", options.timeout.count()}});
    }

    // Sleep until the next poll, a pushed change, the deadline or a stop.
    // A missing or zero interval from the peer falls back to the default.
    auto interval = options.default_poll_interval;
    if (rec->descriptor.pollInterval && *rec->descriptor.pollInterval > 0) {
      interval = std::chrono::milliseconds(*rec->descriptor.pollInterval);
    }
    interval = std::max(interval, kMinPollInterval);
    const auto version = rec->version;
    const bool changed =
        cv_.wait_until(lock, options.stop_token, std::min(deadline, now + interval),
                       [&]() { return rec->version != version; });

    if (options.stop_token.stop_requested()) {
      lock.unlock();
      try {
        cancel(task_id);
      } catch (const HubException &e) {
        MCPHUB_LOG_DEBUG("[" + label_ + "] Cancel of task " + task_id +
                         " after stop failed: " + e.what());
      }
      // Nobody waits for this task any more
      finish(task_id, rec);
      throw CancelledException("Task wait cancelled", {{"taskId", task_id}});
    }
    // Pushes make polling unnecessary
    if (changed || rec->push_observed ||
        std::chrono::steady_clock::now() >= deadline) {
      continue;
    }

    lock.unlock();
    get(task_id);
    lock.lock();
  }

  // Terminal: fetch the result or turn the status into an exception
  const auto final_state = rec->descriptor;
  lock.unlock();

  switch (final_state.status) {
  case TaskStatus::Completed:
    return result(task_id);
  case TaskStatus::Failed:
    finish(task_id, rec);
    throw TaskFailedException(task_id,
                              final_state.statusMessage.value_or("Task failed"));
  default:
    finish(task_id, rec);
    throw CancelledException(final_state.statusMessage.value_or("Task cancelled"),
                             {{"taskId", task_id}});
  }
}

types::TaskDescriptor
InitiatorTaskCoordinator::get(const std::string &task_id) {
  auto raw = requester_(methods::GetTask, {{"taskId", task_id}});
  auto descriptor = json_utils::decode<types::TaskDescriptor>(
      descriptorBody(raw), json_utils::schemas::taskDescriptor(),
      "task descriptor");
  applyStatus(descriptor, false);
  return descriptor;
}

nlohmann::json InitiatorTaskCoordinator::result(const std::string &task_id) {
  auto rec = find(task_id);
  if (rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rec->result_claimed) {
      throw ProtocolException(types::ErrorCode::InvalidRequest,
                              "Result of task " + task_id +
                                  " was already retrieved");
    }
    rec->result_claimed = true;
  }

  // Release the claim on failure so the caller may retry
  nlohmann::json payload;
  try {
    payload = requester_(methods::TaskResult, {{"taskId", task_id}});
  } catch (...) {
    if (rec) {
      std::lock_guard<std::mutex> lock(mutex_);
      rec->result_claimed = false;
    }
    throw;
  }

  if (rec) {
    finish(task_id, rec);
  }
  return payload;
}

types::TaskDescriptor
InitiatorTaskCoordinator::cancel(const std::string &task_id) {
  auto rec = find(task_id);
  if (rec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (types::isTerminal(rec->descriptor.status)) {
      throw InvalidTaskTransitionException(task_id, rec->descriptor.status,
                                           TaskStatus::Cancelled);
    }
  }

  auto raw = requester_(methods::CancelTask, {{"taskId", task_id}});
  auto descriptor = json_utils::decode<types::TaskDescriptor>(
      descriptorBody(raw), json_utils::schemas::taskDescriptor(),
      "task descriptor");

  // Wake waiters with the cancelled status, then drop the record
  if (rec) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!types::isTerminal(rec->descriptor.status)) {
        rec->descriptor.status = TaskStatus::Cancelled;
        rec->descriptor.statusMessage = descriptor.statusMessage;
        ++rec->version;
      }
      cv_.notify_all();
    }
    finish(task_id, rec);
  }
  return descriptor;
}

types::ListTasksResult
InitiatorTaskCoordinator::list(const std::optional<std::string> &cursor) {
  nlohmann::json params = nlohmann::json::object();
  if (cursor) {
    params["cursor"] = *cursor;
  }
  auto raw = requester_(methods::ListTasks, params);
  return json_utils::decode<types::ListTasksResult>(
      raw, json_utils::schemas::listTasksResult(), "task list");
}

std::optional<types::TaskDescriptor>
InitiatorTaskCoordinator::local(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second->descriptor;
}

std::size_t InitiatorTaskCoordinator::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

void InitiatorTaskCoordinator::failAll(const std::string &reason) {
  std::map<std::string, std::shared_ptr<Record>> tasks;
  std::vector<std::string> tokens;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.swap(tasks_);
    for (auto &[task_id, rec] : tasks) {
      if (!types::isTerminal(rec->descriptor.status)) {
        rec->descriptor.status = TaskStatus::Failed;
        rec->descriptor.statusMessage = reason;
        ++rec->version;
      }
      scheduler_.cancel(rec->ttl_timer);
      if (rec->progress_token) {
        tokens.push_back(*rec->progress_token);
      }
    }
    cv_.notify_all();
  }
  for (const auto &token : tokens) {
    progress_.release(token);
  }
  if (!tasks.empty()) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] Dropped " +
                     std::to_string(tasks.size()) + " task(s): " + reason);
  }
}

std::shared_ptr<InitiatorTaskCoordinator::Record>
InitiatorTaskCoordinator::find(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  return it == tasks_.end() ? nullptr : it->second;
}

void InitiatorTaskCoordinator::finish(const std::string &task_id,
                                      const std::shared_ptr<Record> &rec) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it != tasks_.end() && it->second == rec) {
      tasks_.erase(it);
    }
    scheduler_.cancel(rec->ttl_timer);
  }
  if (rec->progress_token) {
    progress_.release(*rec->progress_token);
  }
}

void InitiatorTaskCoordinator::expire(const std::string &task_id) {
  std::shared_ptr<Record> rec;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return;
    }
    rec = it->second;
    tasks_.erase(it);
    if (!types::isTerminal(rec->descriptor.status)) {
      rec->descriptor.status = TaskStatus::Failed;
      rec->descriptor.statusMessage = "Task expired";
      ++rec->version;
    }
    cv_.notify_all();
  }
  if (rec->progress_token) {
    progress_.release(*rec->progress_token);
  }
  MCPHUB_LOG_DEBUG("[" + label_ + "] Task " + task_id + " expired");
}

// --- ReceiverTaskCoordinator -----------------------------------------------

ReceiverTaskCoordinator::ReceiverTaskCoordinator(utils::Scheduler &scheduler,
                                                 StatusNotifier notifier,
                                                 ReceiverTaskConfig config,
                                                 std::string label)
    : scheduler_(scheduler), notifier_(std::move(notifier)), config_(config),
      label_(std::move(label)) {
  config_.page_size = std::max<std::size_t>(config_.page_size, 1);
}

ReceiverTaskCoordinator::~ReceiverTaskCoordinator() {
  failAll("Connection closed");
}

types::TaskDescriptor
ReceiverTaskCoordinator::create(const std::string &scope,
                                const types::TaskMetadata &metadata,
                                std::stop_token *work) {
  auto ttl = config_.default_ttl;
  if (metadata.ttl) {
    ttl = std::chrono::milliseconds(std::max<std::int64_t>(*metadata.ttl, 0));
  }
  ttl = std::min(ttl, config_.max_ttl);

  // Requested TTL, clamped to the configured maximum
  auto rec = std::make_shared<Record>();
  const auto now = json_utils::toIso8601(std::chrono::system_clock::now());
  rec->descriptor.taskId = ids::newTaskId();
  rec->descriptor.status = TaskStatus::Working;
  rec->descriptor.pollInterval = config_.poll_interval.count();
  rec->descriptor.ttl = ttl.count();
  rec->descriptor.createdAt = now;
  rec->descriptor.lastUpdatedAt = now;
  rec->scope = scope;
  rec->expires_at = Clock::now() + ttl;

  const std::string task_id = rec->descriptor.taskId;

  // Insert before arming the timer so an immediate expiry finds the record
  std::lock_guard<std::mutex> lock(mutex_);
  rec->sequence = next_sequence_++;
  order_.emplace(rec->sequence, task_id);
  tasks_.emplace(task_id, rec);
  rec->ttl_timer =
      scheduler_.scheduleAfter(ttl, [this, task_id]() { purge(task_id); });
  if (work) {
    *work = rec->work.get_token();
  }
  MCPHUB_LOG_DEBUG("[" + label_ + "] Created task " + task_id + " (ttl " +
                   std::to_string(ttl.count()) + "ms)");
  return rec->descriptor;
}

std::stop_token
ReceiverTaskCoordinator::workToken(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    throw TaskNotFoundException(task_id);
  }
  return it->second->work.get_token();
}

void ReceiverTaskCoordinator::transition(const std::string &task_id,
                                         TaskStatus to,
                                         std::optional<std::string> message) {
  types::TaskDescriptor descriptor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rec = lookupLocked(task_id, nullptr);
    descriptor = applyLocked(*rec, to, std::move(message));
  }
  publish(descriptor);
}

void ReceiverTaskCoordinator::complete(const std::string &task_id,
                                       nlohmann::json result) {
  types::TaskDescriptor descriptor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rec = lookupLocked(task_id, nullptr);
    descriptor = applyLocked(*rec, TaskStatus::Completed, std::nullopt);
    rec->result = std::move(result);
  }
  publish(descriptor);
}

void ReceiverTaskCoordinator::fail(const std::string &task_id,
                                   const types::ErrorData &error) {
  types::TaskDescriptor descriptor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rec = lookupLocked(task_id, nullptr);
    descriptor = applyLocked(*rec, TaskStatus::Failed, error.message);
    rec->error = error;
  }
  publish(descriptor);
}

types::TaskDescriptor
ReceiverTaskCoordinator::get(const std::string &task_id,
                             const std::string &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookupLocked(task_id, &scope)->descriptor;
}

nlohmann::json ReceiverTaskCoordinator::result(const std::string &task_id,
                                               const std::string &scope,
                                               std::chrono::milliseconds timeout,
                                               std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto rec = lookupLocked(task_id, &scope);

  // Block until terminal; a purge also ends the wait
  const bool ready = cv_.wait_for(lock, stop, timeout, [&]() {
    return rec->purged || types::isTerminal(rec->descriptor.status);
  });
  if (rec->purged) {
    throw TaskNotFoundException(task_id);
  }
  if (!ready) {
    if (stop.stop_requested()) {
      throw CancelledException("tasks/result cancelled", {{"taskId", task_id}});
    }
    throw TimeoutException("Timed out waiting for task " + task_id,
                           {{"taskId", task_id}});
  }

  const TaskStatus status = rec->descriptor.status;
  std::optional<nlohmann::json> payload = rec->result;
  std::optional<types::ErrorData> error = rec->error;
  const auto message = rec->descriptor.statusMessage;
  if (config_.purge_on_result) {
    removeLocked(task_id, *rec);
  }
  lock.unlock();

  if (status == TaskStatus::Completed) {
    return payload.value_or(nlohmann::json::object());
  }
  if (status == TaskStatus::Failed) {
    std::rethrow_exception(exceptionFromError(error.value_or(types::ErrorData{
        static_cast<int>(types::ErrorCode::TaskFailed),
        message.value_or("Task failed"), {{"taskId", task_id}}})));
  }
  throw CancelledException(message.value_or("Task cancelled"),
                           {{"taskId", task_id}});
}

types::ListTasksResult
ReceiverTaskCoordinator::list(const std::string &scope,
                              const std::optional<std::string> &cursor) {
  std::uint64_t after = 0;
  if (cursor) {
    try {
      std::size_t used = 0;
      after = std::stoull(*cursor, &used);
      if (used != cursor->size()) {
        throw std::invalid_argument(*cursor);
      }
    } catch (const std::exception &) {
      throw ProtocolException(types::ErrorCode::InvalidParams,
                              "Invalid cursor: " + *cursor);
    }
  }

  // Walk in creation order, dropping expired records on the way
  types::ListTasksResult page;
  std::uint64_t last = after;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();
  for (auto it = order_.upper_bound(after); it != order_.end();) {
    auto rec_it = tasks_.find(it->second);
    if (rec_it == tasks_.end()) {
      it = order_.erase(it);
      continue;
    }
    auto rec = rec_it->second;
    if (rec->expires_at <= now) {
      ++it;
      removeLocked(rec->descriptor.taskId, *rec);
      continue;
    }
    if (rec->scope == scope) {
      if (page.tasks.size() == config_.page_size) {
        page.nextCursor = std::to_string(last);
        break;
      }
      page.tasks.push_back(rec->descriptor);
      last = it->first;
    }
    ++it;
  }
  return page;
}

types::TaskDescriptor
ReceiverTaskCoordinator::cancel(const std::string &task_id,
                                const std::string &scope) {
  types::TaskDescriptor descriptor;
  std::stop_source work;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto rec = lookupLocked(task_id, &scope);
    if (types::isTerminal(rec->descriptor.status)) {
      throw InvalidTaskTransitionException(task_id, rec->descriptor.status,
                                           TaskStatus::Cancelled);
    }
    descriptor = applyLocked(*rec, TaskStatus::Cancelled, "Cancelled by peer");
    work = rec->work;
  }
  work.request_stop();
  publish(descriptor);
  return descriptor;
}

void ReceiverTaskCoordinator::failAll(const std::string &reason) {
  std::vector<std::stop_source> stops;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[task_id, rec] : tasks_) {
      if (!types::isTerminal(rec->descriptor.status)) {
        rec->descriptor.status = TaskStatus::Failed;
        rec->descriptor.statusMessage = reason;
        rec->error = types::ErrorData{
            static_cast<int>(types::ErrorCode::ConnectionClosed), reason,
            nullptr};
      }
      rec->purged = true;
      scheduler_.cancel(rec->ttl_timer);
      stops.push_back(rec->work);
    }
    tasks_.clear();
    order_.clear();
    cv_.notify_all();
  }
  for (auto &stop : stops) {
    stop.request_stop();
  }
}

std::size_t ReceiverTaskCoordinator::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

std::shared_ptr<ReceiverTaskCoordinator::Record>
ReceiverTaskCoordinator::lookupLocked(const std::string &task_id,
                                      const std::string *scope) {
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    throw TaskNotFoundException(task_id);
  }
  auto rec = it->second;
  if (rec->expires_at <= Clock::now()) {
    removeLocked(task_id, *rec);
    throw TaskNotFoundException(task_id);
  }
  if (scope && rec->scope != *scope) {
    throw TaskNotFoundException(task_id);
  }
  return rec;
}

types::TaskDescriptor
ReceiverTaskCoordinator::applyLocked(Record &rec, TaskStatus to,
                                     std::optional<std::string> message) {
  const TaskStatus from = rec.descriptor.status;
  if (from != to && !canTransition(from, to)) {
    throw InvalidTaskTransitionException(rec.descriptor.taskId, from, to);
  }
  if (from == to && types::isTerminal(from)) {
    throw InvalidTaskTransitionException(rec.descriptor.taskId, from, to);
  }
  rec.descriptor.status = to;
  rec.descriptor.statusMessage = std::move(message);
  rec.descriptor.lastUpdatedAt =
      json_utils::toIso8601(std::chrono::system_clock::now());
  cv_.notify_all();
  return rec.descriptor;
}

void ReceiverTaskCoordinator::removeLocked(const std::string &task_id,
                                           Record &rec) {
  rec.purged = true;
  scheduler_.cancel(rec.ttl_timer);
  order_.erase(rec.sequence);
  tasks_.erase(task_id);
  cv_.notify_all();
}

void ReceiverTaskCoordinator::purge(const std::string &task_id) {
  std::stop_source work;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return;
    }
    auto rec = it->second;
    work = rec->work;
    removeLocked(task_id, *rec);
  }
  // Abandoned work has nobody left to report to.
  work.request_stop();
  MCPHUB_LOG_DEBUG("[" + label_ + "] Task " + task_id + " expired");
}

void ReceiverTaskCoordinator::publish(const types::TaskDescriptor &descriptor) {
  if (!notifier_) {
    return;
  }
  try {
    notifier_(descriptor);
  } catch (const std::exception &e) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] Status of task " + descriptor.taskId +
                     " not delivered: " + e.what());
  }
}

} // namespace session
} // namespace mcphub
