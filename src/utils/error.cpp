#include "mcphub/utils/error.hpp"

namespace mcphub {

namespace {
types::ErrorData makeError(types::ErrorCode code, const std::string &message,
                           const nlohmann::json &data) {
  return {.code = static_cast<int>(code), .message = message, .data = data};
}
} // namespace

HubException::HubException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

HubException::HubException(types::ErrorCode code, const std::string &message,
                           const nlohmann::json &data)
    : std::runtime_error(message), error_(makeError(code, message, data)) {}

const types::ErrorData &HubException::error() const { return error_; }

bool HubException::is(types::ErrorCode code) const {
  return error_.code == static_cast<int>(code);
}

types::ErrorData &HubException::error_data() { return error_; }

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : HubException(types::ErrorCode::TransportError, message, data) {}

TransportException::TransportException(types::ErrorCode code,
                                       const std::string &message,
                                       const nlohmann::json &data)
    : HubException(code, message, data) {}

TransportException::TransportException(const std::error_code &error)
    : HubException(types::ErrorCode::TransportError, error.message(),
                   {{"category", error.category().name()},
                    {"value", error.value()}}) {}

TransportException::TransportException(types::ErrorData error)
    : HubException(std::move(error)) {}

ProtocolException::ProtocolException(const std::string &message,
                                     const nlohmann::json &data)
    : HubException(types::ErrorCode::ProtocolError, message, data) {}

ProtocolException::ProtocolException(types::ErrorCode code,
                                     const std::string &message,
                                     const nlohmann::json &data)
    : HubException(code, message, data) {}

ProtocolException::ProtocolException(types::ErrorData error)
    : HubException(std::move(error)) {}

TimeoutException::TimeoutException(const std::string &message,
                                   const nlohmann::json &data)
    : HubException(types::ErrorCode::TimeoutError, message, data) {}

TimeoutException::TimeoutException(types::ErrorData error)
    : HubException(std::move(error)) {}

CapabilityException::CapabilityException(const std::string &message,
                                         const nlohmann::json &data)
    : HubException(types::ErrorCode::CapabilityError, message, data) {}

CapabilityException::CapabilityException(types::ErrorData error)
    : HubException(std::move(error)) {}

CancelledException::CancelledException(const std::string &message,
                                       const nlohmann::json &data)
    : HubException(types::ErrorCode::RequestCancelled, message, data) {}

CancelledException::CancelledException(types::ErrorData error)
    : HubException(std::move(error)) {}

DeclinedException::DeclinedException(const std::string &message,
                                     const nlohmann::json &data)
    : HubException(types::ErrorCode::Declined, message, data) {}

DeclinedException::DeclinedException(types::ErrorData error)
    : HubException(std::move(error)) {}

TaskNotFoundException::TaskNotFoundException(const std::string &task_id)
    : HubException(types::ErrorCode::TaskNotFound, "Task not found: " + task_id,
                   {{"taskId", task_id}}) {}

TaskNotFoundException::TaskNotFoundException(types::ErrorData error)
    : HubException(std::move(error)) {}

InvalidTaskTransitionException::InvalidTaskTransitionException(
    const std::string &task_id, types::TaskStatus from, types::TaskStatus to)
    : HubException(types::ErrorCode::InvalidTaskTransition,
                   "Invalid transition for task " + task_id + ": " +
                       types::toString(from) + " -> " + types::toString(to),
                   {{"taskId", task_id},
                    {"from", types::toString(from)},
                    {"to", types::toString(to)}}) {}

InvalidTaskTransitionException::InvalidTaskTransitionException(
    types::ErrorData error)
    : HubException(std::move(error)) {}

NotCancellableException::NotCancellableException(const std::string &request_id,
                                                 const std::string &method)
    : HubException(types::ErrorCode::NotCancellable,
                   "Request " + request_id + " (" + method +
                       ") cannot be cancelled",
                   {{"requestId", request_id}, {"method", method}}) {}

NotCancellableException::NotCancellableException(types::ErrorData error)
    : HubException(std::move(error)) {}

TaskFailedException::TaskFailedException(const std::string &task_id,
                                         const std::string &message)
    : HubException(types::ErrorCode::TaskFailed, message,
                   {{"taskId", task_id}}) {}

TaskFailedException::TaskFailedException(types::ErrorData error)
    : HubException(std::move(error)) {}

InputRequiredException::InputRequiredException(const std::string &task_id,
                                               const std::string &message)
    : HubException(types::ErrorCode::InputRequired, message,
                   {{"taskId", task_id}}) {}

InputRequiredException::InputRequiredException(types::ErrorData error)
    : HubException(std::move(error)) {}

std::exception_ptr exceptionFromError(const types::ErrorData &error) {
  switch (static_cast<types::ErrorCode>(error.code)) {
  case types::ErrorCode::TransportError:
  case types::ErrorCode::ConnectionClosed:
    return std::make_exception_ptr(TransportException(error));
  case types::ErrorCode::TimeoutError:
    return std::make_exception_ptr(TimeoutException(error));
  case types::ErrorCode::CapabilityError:
    return std::make_exception_ptr(CapabilityException(error));
  case types::ErrorCode::Declined:
    return std::make_exception_ptr(DeclinedException(error));
  case types::ErrorCode::TaskNotFound:
    return std::make_exception_ptr(TaskNotFoundException(error));
  case types::ErrorCode::InvalidTaskTransition:
    return std::make_exception_ptr(InvalidTaskTransitionException(error));
  case types::ErrorCode::NotCancellable:
    return std::make_exception_ptr(NotCancellableException(error));
  case types::ErrorCode::TaskFailed:
    return std::make_exception_ptr(TaskFailedException(error));
  case types::ErrorCode::InputRequired:
    return std::make_exception_ptr(InputRequiredException(error));
  case types::ErrorCode::RequestCancelled:
    return std::make_exception_ptr(CancelledException(error));
  default:
    return std::make_exception_ptr(ProtocolException(error));
  }
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const HubException &exception) {
  return {.jsonrpc = "2.0", .id = id, .error = exception.error()};
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        const types::ErrorData &error) {
  return {.jsonrpc = "2.0", .id = id, .error = error};
}

types::JSONRPCError createErrorResponse(const types::RequestId &id,
                                        types::ErrorCode code,
                                        const std::string &message,
                                        const nlohmann::json &data) {
  return {.jsonrpc = "2.0", .id = id, .error = makeError(code, message, data)};
}

} // namespace mcphub
