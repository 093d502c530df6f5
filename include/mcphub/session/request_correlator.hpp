#ifndef MCPHUB_SESSION_REQUEST_CORRELATOR_HPP_
#define MCPHUB_SESSION_REQUEST_CORRELATOR_HPP_

#include "mcphub/transport/transport.hpp"
#include "mcphub/types.hpp"
#include "mcphub/utils/scheduler.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

namespace mcphub {
namespace session {

/**
 * @brief Per-request options for RequestCorrelator::send
 */
struct RequestOptions {
  std::optional<types::RequestId> id;             ///< Preallocated id
  std::optional<std::chrono::milliseconds> timeout; ///< Local deadline
  std::optional<std::string> progress_token; ///< Sent as _meta.progressToken
  bool cancellable = true; ///< False for the handshake
  std::stop_token stop_token; ///< Caller side cancellation
  /// Runs on a successful response before the future becomes ready. If it
  /// throws, the future fails with that exception instead.
  std::function<void(const nlohmann::json &)> on_result;
  std::function<void()> on_settled; ///< Runs once when the request settles
};

/**
 * @brief A request in flight
 */
struct PendingCall {
  types::RequestId id;                ///< Correlation id
  std::future<nlohmann::json> result; ///< Result or the failure
};

/**
 * @brief Matches responses to requests and owns their cancellation
 *
 * Every pending request is settled exactly once: the first of response,
 * error, cancellation, deadline or teardown removes it, later events for the
 * same id are ignored. Completion callbacks run outside the internal lock.
 */
class RequestCorrelator {
public:
  /**
   * @brief Construct a correlator for one connection
   *
   * @param transport The connection's transport
   * @param scheduler Timer queue for deadlines, owned by the connection
   * @param label Connection name used in log messages
   */
  RequestCorrelator(std::shared_ptr<transport::Transport> transport,
                    utils::Scheduler &scheduler, std::string label);
  ~RequestCorrelator();

  RequestCorrelator(const RequestCorrelator &) = delete;
  RequestCorrelator &operator=(const RequestCorrelator &) = delete;

  /**
   * @brief Allocate a correlation id ahead of send()
   */
  types::RequestId nextRequestId() const;

  /**
   * @brief Send a request
   *
   * Transport failures are reported through the returned future.
   *
   * @param method The method name
   * @param params The request parameters
   * @param options Deadline, progress token and cancellation settings
   * @return PendingCall The id and the future result
   */
  PendingCall send(const std::string &method,
                   std::optional<nlohmann::json> params,
                   RequestOptions options = {});

  /**
   * @brief Send a notification and wait for the write
   *
   * @throws TransportException if the write fails
   */
  void notify(const std::string &method, std::optional<nlohmann::json> params);

  /**
   * @brief Send a notification without waiting, failures are only logged
   */
  void notifyBestEffort(const std::string &method,
                        std::optional<nlohmann::json> params);

  /**
   * @brief Cancel a pending request
   *
   * Informs the peer with notifications/cancelled and fails the local future
   * with CancelledException. Unknown or already settled ids are ignored.
   *
   * @param id The correlation id
   * @param reason Optional reason forwarded to the peer
   * @return true if a pending request was cancelled
   * @throws NotCancellableException for the handshake request
   */
  bool cancel(const types::RequestId &id,
              std::optional<std::string> reason = std::nullopt);

  /**
   * @brief Settle a request with the peer's result
   *
   * @return false if the id was not pending
   */
  bool handleResponse(const types::JSONRPCResponse &response);

  /**
   * @brief Settle a request with the peer's error
   *
   * @return false if the id was not pending
   */
  bool handleError(const types::JSONRPCError &error);

  /**
   * @brief Track a request received from the peer
   *
   * @return std::stop_token Stopped when the peer cancels the request or the
   * connection closes
   */
  std::stop_token registerInbound(const types::RequestId &id,
                                  const std::string &method);

  /**
   * @brief Forget an inbound request once it has been answered
   */
  void completeInbound(const types::RequestId &id);

  /**
   * @brief Apply a notifications/cancelled from the peer
   *
   * @return true if an inbound request was stopped
   */
  bool handleCancelledNotification(const types::CancelledParams &params);

  /**
   * @brief Fail every pending request and stop every inbound one
   *
   * @param reason Message of the ConnectionClosed error
   */
  void abortAll(const std::string &reason);

  bool isPending(const types::RequestId &id) const;
  std::size_t pendingCount() const;
  std::size_t inboundCount() const;

private:
  struct PendingRequest {
    std::string method;
    std::promise<nlohmann::json> promise;
    bool cancellable = true;
    utils::Scheduler::TimerId deadline = utils::Scheduler::kInvalidTimer;
    std::unique_ptr<std::stop_callback<std::function<void()>>> stop_callback;
    std::function<void(const nlohmann::json &)> on_result;
    std::function<void()> on_settled;
  };

  struct InboundRequest {
    std::string method;
    std::stop_source stop_source;
  };

  std::optional<PendingRequest> take(const std::string &key);
  void settle(PendingRequest &request, nlohmann::json result);
  void settle(PendingRequest &request, std::exception_ptr error);
  void runSettledHook(PendingRequest &request);
  void expire(const std::string &key, std::chrono::milliseconds timeout);
  void sendCancelled(const types::RequestId &id,
                     const std::optional<std::string> &reason);

  std::shared_ptr<transport::Transport> transport_;
  utils::Scheduler &scheduler_;
  std::string label_;

  mutable std::mutex mutex_;
  std::map<std::string, PendingRequest> pending_;
  std::map<std::string, InboundRequest> inbound_;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_REQUEST_CORRELATOR_HPP_
