#ifndef MCPHUB_SESSION_CONNECTION_HPP_
#define MCPHUB_SESSION_CONNECTION_HPP_

#include "mcphub/config.hpp"
#include "mcphub/host.hpp"
#include "mcphub/session/capability_negotiator.hpp"
#include "mcphub/session/notification_router.hpp"
#include "mcphub/session/progress_tracker.hpp"
#include "mcphub/session/request_correlator.hpp"
#include "mcphub/session/task_coordinator.hpp"
#include "mcphub/transport/transport.hpp"
#include "mcphub/utils/error_history.hpp"
#include "mcphub/utils/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

namespace mcphub {
namespace session {

/**
 * @brief Per-call options of Connection::call
 */
struct CallOptions {
  /// Local deadline, defaults to the server's request timeout.
  std::optional<std::chrono::milliseconds> timeout;
  /// Requests progress notifications when set.
  ProgressObserver progress;
  /// Ask the peer to run the request as a task and wait for its result.
  bool as_task = false;
  /// Requested retention of the task.
  std::optional<std::chrono::milliseconds> task_ttl;
  /// How to wait for the task, defaults to HubConfig::task_wait.
  std::optional<TaskWaitOptions> task_wait;
  /// Cancels the request, and the task once created.
  std::stop_token stop_token;
};

/**
 * @brief Outcome of a request sent with task augmentation
 *
 * Peers that do not run the request as a task answer with the plain result.
 */
struct TaskCallResult {
  std::optional<types::TaskDescriptor> task; ///< Set when a task was created
  nlohmann::json result;                     ///< Raw result of the request

  bool isTask() const { return task.has_value(); }
};

struct PendingTaskCall {
  types::RequestId id;
  std::future<TaskCallResult> result;
};

/**
 * @brief One live session with a tool server
 *
 * Owns the transport and one instance of each tracker. Serves the requests
 * the server sends back (roots, sampling, elicitation, tasks). Must be
 * created through std::make_shared; close() must not be called from a
 * transport callback.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
  struct Callbacks {
    /// Appends to the connection's error history.
    std::function<void(const std::string &message, utils::ErrorLevel level)>
        record_error;
    /// The transport failed or closed; runs on the transport thread.
    std::function<void(const std::string &reason, bool is_error)> lost;
  };

  /**
   * @brief Construct a connection
   *
   * @param name Server name
   * @param source Configuration source, for notifications
   * @param transport Transport created for the server
   * @param config Hub settings
   * @param request_timeout Default deadline of requests to this server
   * @param router Router shared by all connections of the hub
   * @param host Link to the host collaborator
   * @param callbacks Hooks into the owning registry entry
   */
  Connection(std::string name, std::string source,
             std::shared_ptr<transport::Transport> transport,
             const HubConfig &config,
             std::chrono::milliseconds request_timeout,
             NotificationRouter &router, HostLink &host, Callbacks callbacks);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  /**
   * @brief Connect the transport and run the handshake
   *
   * @return types::InitializeResult The server's initialize result
   * @throws TransportException, ProtocolException, TimeoutException
   */
  types::InitializeResult open();

  /**
   * @brief Tear the session down, idempotent
   *
   * Pending requests fail with ConnectionClosed, tasks are marked failed,
   * progress tokens released, timers cancelled and workers joined.
   */
  void close(const std::string &reason);

  bool isOpen() const;

  /**
   * @brief Send a request
   *
   * With CallOptions::as_task the future resolves to the task's result.
   */
  PendingCall call(const std::string &method,
                   std::optional<nlohmann::json> params,
                   CallOptions options = {});

  /**
   * @brief Send a request with task augmentation if the peer supports it
   *
   * A task created by the peer is tracked as soon as its CreateTaskResult
   * arrives, whether or not the returned future is ever read.
   */
  PendingTaskCall callAsTask(const std::string &method,
                             std::optional<nlohmann::json> params,
                             CallOptions options = {});

  /**
   * @brief Send a request and wait for its result
   */
  nlohmann::json request(const std::string &method,
                         std::optional<nlohmann::json> params = std::nullopt);

  /**
   * @brief Cancel a pending request
   *
   * @return false if the id is not pending
   */
  bool cancel(const types::RequestId &id,
              std::optional<std::string> reason = std::nullopt);

  /**
   * @brief List every tool, following cursors, and cache task hints
   */
  std::vector<types::Tool> listTools();

  /**
   * @brief List every resource template, following cursors
   *
   * @throws CapabilityException if the peer has no resources capability
   */
  std::vector<types::ResourceTemplate> listResourceTemplates();

  void subscribeResource(const std::string &uri);
  void unsubscribeResource(const std::string &uri);
  std::set<std::string> subscribedResources() const;

  const std::string &name() const { return name_; }
  const std::string &scope() const { return scope_; }

  CapabilityNegotiator &negotiator() { return negotiator_; }
  RequestCorrelator &correlator() { return correlator_; }
  ProgressTracker &progress() { return progress_; }
  InitiatorTaskCoordinator &tasks() { return initiator_; }
  ReceiverTaskCoordinator &servedTasks() { return receiver_; }

private:
  using HostWork = std::function<nlohmann::json(
      std::stop_token, const std::optional<std::string> &task_id)>;

  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void ensureOpen() const;
  void handleMessage(const types::JSONRPCMessage &message);
  void handleRequest(const types::JSONRPCRequest &request);
  void handleLogMessage(const types::LoggingMessageParams &params);
  void handleTransportError(const std::error_code &error);
  void handleTransportClosed();

  void serveAsync(const types::JSONRPCRequest &request,
                  std::function<nlohmann::json(std::stop_token)> work);
  void serveAsTask(const types::JSONRPCRequest &request,
                   const types::TaskMetadata &metadata, HostWork work);
  nlohmann::json elicit(const nlohmann::json &params, std::stop_token stop,
                        const std::optional<std::string> &task_id);
  nlohmann::json sample(const nlohmann::json &params, std::stop_token stop,
                        const std::optional<std::string> &task_id);
  template <typename T> T awaitHost(std::future<T> future, std::stop_token stop);

  void respond(const types::RequestId &id, nlohmann::json result);
  void respondError(const types::RequestId &id, const types::ErrorData &error);
  bool spawn(std::function<void(std::stop_token)> job);
  void reapWorkers();

  const std::string name_;
  const std::string source_;
  const std::string scope_;
  const HubConfig config_;
  const std::chrono::milliseconds request_timeout_;
  std::shared_ptr<transport::Transport> transport_;
  NotificationRouter &router_;
  HostLink &host_;
  Callbacks callbacks_;

  utils::Scheduler scheduler_;
  CapabilityNegotiator negotiator_;
  ProgressTracker progress_;
  RequestCorrelator correlator_;
  InitiatorTaskCoordinator initiator_;
  ReceiverTaskCoordinator receiver_;
  InlineRoutes routes_;

  std::atomic<bool> open_{false};
  std::atomic<bool> closed_{false};

  mutable std::mutex mutex_; ///< Guards workers_ and subscriptions_
  std::list<Worker> workers_;
  std::set<std::string> subscriptions_;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_CONNECTION_HPP_
