#ifndef MCPHUB_UTILS_ERROR_HPP_
#define MCPHUB_UTILS_ERROR_HPP_

#include "mcphub/types.hpp"
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mcphub {

/**
 * @brief Base exception class for hub errors
 *
 * This class extends std::runtime_error and carries the JSON-RPC error data
 * that is reported to callers or sent back to a peer.
 */
class HubException : public std::runtime_error {
public:
  /**
   * @brief Construct a new HubException with error data
   *
   * @param error The error data
   */
  explicit HubException(types::ErrorData error);

  /**
   * @brief Construct a new HubException with error code and message
   *
   * @param code The error code
   * @param message The error message
   * @param data Optional additional data
   */
  explicit HubException(types::ErrorCode code, const std::string &message,
                        const nlohmann::json &data = nullptr);

  /**
   * @brief Get the error data
   *
   * @return const types::ErrorData& The error data
   */
  const types::ErrorData &error() const;

  /**
   * @brief Whether the error carries the given code
   */
  bool is(types::ErrorCode code) const;

protected:
  types::ErrorData &error_data();

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Exception for transport-related errors
 *
 * Also raised with ErrorCode::ConnectionClosed for requests that were still
 * pending when their connection was torn down.
 */
class TransportException : public HubException {
public:
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);
  explicit TransportException(types::ErrorCode code, const std::string &message,
                              const nlohmann::json &data = nullptr);
  explicit TransportException(const std::error_code &error);
  explicit TransportException(types::ErrorData error);
};

/**
 * @brief Exception for protocol errors and errors reported by the peer
 */
class ProtocolException : public HubException {
public:
  explicit ProtocolException(const std::string &message,
                             const nlohmann::json &data = nullptr);
  explicit ProtocolException(types::ErrorCode code, const std::string &message,
                             const nlohmann::json &data = nullptr);
  explicit ProtocolException(types::ErrorData error);
};

/**
 * @brief Exception for timeout errors
 */
class TimeoutException : public HubException {
public:
  explicit TimeoutException(const std::string &message,
                            const nlohmann::json &data = nullptr);
  explicit TimeoutException(types::ErrorData error);
};

/**
 * @brief The peer did not negotiate a feature the operation needs
 */
class CapabilityException : public HubException {
public:
  explicit CapabilityException(const std::string &message,
                               const nlohmann::json &data = nullptr);
  explicit CapabilityException(types::ErrorData error);
};

/**
 * @brief A request or task was cancelled
 */
class CancelledException : public HubException {
public:
  explicit CancelledException(const std::string &message = "Request cancelled",
                              const nlohmann::json &data = nullptr);
  explicit CancelledException(types::ErrorData error);
};

/**
 * @brief The host declined the request
 */
class DeclinedException : public HubException {
public:
  explicit DeclinedException(const std::string &message,
                             const nlohmann::json &data = nullptr);
  explicit DeclinedException(types::ErrorData error);
};

/**
 * @brief The task id is unknown, expired or belongs to another session
 */
class TaskNotFoundException : public HubException {
public:
  explicit TaskNotFoundException(const std::string &task_id);
  explicit TaskNotFoundException(types::ErrorData error);
};

/**
 * @brief A task status change the state machine does not allow
 */
class InvalidTaskTransitionException : public HubException {
public:
  InvalidTaskTransitionException(const std::string &task_id,
                                 types::TaskStatus from, types::TaskStatus to);
  explicit InvalidTaskTransitionException(types::ErrorData error);
};

/**
 * @brief Cancellation was requested for a request that may not be cancelled
 */
class NotCancellableException : public HubException {
public:
  explicit NotCancellableException(const std::string &request_id,
                                   const std::string &method);
  explicit NotCancellableException(types::ErrorData error);
};

/**
 * @brief A task finished in the failed status
 */
class TaskFailedException : public HubException {
public:
  TaskFailedException(const std::string &task_id, const std::string &message);
  explicit TaskFailedException(types::ErrorData error);
};

/**
 * @brief A task entered input_required and nobody handled it
 */
class InputRequiredException : public HubException {
public:
  InputRequiredException(const std::string &task_id,
                         const std::string &message);
  explicit InputRequiredException(types::ErrorData error);
};

/**
 * @brief Rebuild the specific exception type for an error received on the
 * wire
 *
 * Codes without a dedicated type become ProtocolException so a remote error
 * stays distinguishable from local timeouts and cancellations.
 *
 * @param error The error data
 * @return std::exception_ptr Pointer to the matching exception
 */
std::exception_ptr exceptionFromError(const types::ErrorData &error);

/**
 * @brief Create an error response from an exception
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const HubException &exception);

/**
 * @brief Create an error response from error data
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error);

/**
 * @brief Create an error response from error code and message
 */
types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data = nullptr);

} // namespace mcphub

#endif // MCPHUB_UTILS_ERROR_HPP_
