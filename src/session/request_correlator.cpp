#include "mcphub/session/request_correlator.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/ids.hpp"
#include "mcphub/utils/logging.hpp"

namespace mcphub {
namespace session {

RequestCorrelator::RequestCorrelator(
    std::shared_ptr<transport::Transport> transport,
    utils::Scheduler &scheduler, std::string label)
    : transport_(std::move(transport)), scheduler_(scheduler),
      label_(std::move(label)) {}

RequestCorrelator::~RequestCorrelator() { abortAll("Connection closed"); }

types::RequestId RequestCorrelator::nextRequestId() const {
  return ids::newRequestId();
}

PendingCall RequestCorrelator::send(const std::string &method,
                                    std::optional<nlohmann::json> params,
                                    RequestOptions options) {
  types::RequestId id = options.id ? *options.id : nextRequestId();
  const std::string key = types::requestIdToString(id);

  if (options.progress_token) {
    if (!params || !params->is_object()) {
      params = nlohmann::json::object();
    }
    (*params)["_meta"]["progressToken"] = *options.progress_token;
  }

  PendingRequest entry;
  entry.method = method;
  entry.cancellable = options.cancellable;
  entry.on_result = std::move(options.on_result);
  entry.on_settled = std::move(options.on_settled);
  auto future = entry.promise.get_future();

  if (options.cancellable && options.stop_token.stop_requested()) {
    settle(entry, std::make_exception_ptr(CancelledException(
                      "Cancelled before sending",
                      {{"requestId", key}, {"method", method}})));
    return {std::move(id), std::move(future)};
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.emplace(key, std::move(entry)).second) {
      throw ProtocolException(types::ErrorCode::InternalError,
                              "Duplicate request id " + key);
    }
  }

  if (options.timeout) {
    auto timeout = *options.timeout;
    auto timer = scheduler_.scheduleAfter(
        timeout, [this, key, timeout]() { expire(key, timeout); });
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it != pending_.end()) {
      it->second.deadline = timer;
    } else {
      scheduler_.cancel(timer);
    }
  }

  if (options.cancellable && options.stop_token.stop_possible()) {
    // A stop racing with registration runs the callback right here.
    auto callback = std::make_unique<std::stop_callback<std::function<void()>>>(
        options.stop_token,
        std::function<void()>([this, id]() { cancel(id, "Cancelled by caller"); }));
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it != pending_.end()) {
      it->second.stop_callback = std::move(callback);
    }
    lock.unlock();
    callback.reset();
  }

  if (!isPending(id)) {
    return {std::move(id), std::move(future)};
  }

  types::JSONRPCRequest request;
  request.id = id;
  request.method = method;
  request.params = std::move(params);

  MCPHUB_LOG_DEBUG("[" + label_ + "] -> " + method + " (" + key + ")");
  std::error_code ec = transport_->send(request);
  if (ec) {
    if (auto failed = take(key)) {
      settle(*failed, std::make_exception_ptr(TransportException(ec)));
    }
  }

  return {std::move(id), std::move(future)};
}

void RequestCorrelator::notify(const std::string &method,
                               std::optional<nlohmann::json> params) {
  types::JSONRPCNotification notification;
  notification.method = method;
  notification.params = std::move(params);

  std::error_code ec = transport_->send(notification);
  if (ec) {
    throw TransportException(ec);
  }
}

void RequestCorrelator::notifyBestEffort(const std::string &method,
                                         std::optional<nlohmann::json> params) {
  types::JSONRPCNotification notification;
  notification.method = method;
  notification.params = std::move(params);

  try {
    transport_->send(notification,
                     [label = label_, method](const std::error_code &ec) {
                       if (ec) {
                         MCPHUB_LOG_DEBUG("[" + label + "] " + method +
                                          " not delivered: " + ec.message());
                       }
                     });
  } catch (const std::exception &e) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] " + method +
                     " not delivered: " + e.what());
  }
}

bool RequestCorrelator::cancel(const types::RequestId &id,
                               std::optional<std::string> reason) {
  const std::string key = types::requestIdToString(id);
  std::optional<PendingRequest> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(key);
    if (it == pending_.end()) {
      MCPHUB_LOG_DEBUG("[" + label_ + "] Ignoring cancel for request " + key +
                       ", not pending");
      return false;
    }
    if (!it->second.cancellable) {
      throw NotCancellableException(key, it->second.method);
    }
    entry = std::move(it->second);
    pending_.erase(it);
  }

  sendCancelled(id, reason);
  settle(*entry, std::make_exception_ptr(CancelledException(
                     reason.value_or("Request cancelled"),
                     {{"requestId", key}, {"method", entry->method}})));
  return true;
}

bool RequestCorrelator::handleResponse(const types::JSONRPCResponse &response) {
  auto entry = take(types::requestIdToString(response.id));
  if (!entry) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] Response for unknown request " +
                     types::requestIdToString(response.id));
    return false;
  }
  settle(*entry, response.result);
  return true;
}

bool RequestCorrelator::handleError(const types::JSONRPCError &error) {
  auto entry = take(types::requestIdToString(error.id));
  if (!entry) {
    MCPHUB_LOG_DEBUG("[" + label_ + "] Error for unknown request " +
                     types::requestIdToString(error.id));
    return false;
  }
  settle(*entry, exceptionFromError(error.error));
  return true;
}

std::stop_token RequestCorrelator::registerInbound(const types::RequestId &id,
                                                   const std::string &method) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &entry = inbound_[types::requestIdToString(id)];
  entry.method = method;
  return entry.stop_source.get_token();
}

void RequestCorrelator::completeInbound(const types::RequestId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  inbound_.erase(types::requestIdToString(id));
}

bool RequestCorrelator::handleCancelledNotification(
    const types::CancelledParams &params) {
  const std::string key = types::requestIdToString(params.requestId);
  std::stop_source source;
  std::string method;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inbound_.find(key);
    if (it == inbound_.end()) {
      MCPHUB_LOG_DEBUG("[" + label_ + "] Cancellation for unknown request " +
                       key);
      return false;
    }
    source = it->second.stop_source;
    method = it->second.method;
    inbound_.erase(it);
  }

  MCPHUB_LOG_INFO("[" + label_ + "] Peer cancelled " + method + " (" + key +
                  ")" + (params.reason ? ": " + *params.reason : ""));
  source.request_stop();
  return true;
}

void RequestCorrelator::abortAll(const std::string &reason) {
  std::map<std::string, PendingRequest> pending;
  std::map<std::string, InboundRequest> inbound;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(pending_);
    inbound.swap(inbound_);
  }

  for (auto &[key, request] : inbound) {
    request.stop_source.request_stop();
  }
  for (auto &[key, request] : pending) {
    settle(request, std::make_exception_ptr(TransportException(
                        types::ErrorCode::ConnectionClosed, reason,
                        {{"requestId", key}, {"method", request.method}})));
  }
}

bool RequestCorrelator::isPending(const types::RequestId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(types::requestIdToString(id)) > 0;
}

std::size_t RequestCorrelator::pendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::size_t RequestCorrelator::inboundCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inbound_.size();
}

std::optional<RequestCorrelator::PendingRequest>
RequestCorrelator::take(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  PendingRequest entry = std::move(it->second);
  pending_.erase(it);
  return entry;
}

void RequestCorrelator::settle(PendingRequest &request, nlohmann::json result) {
  scheduler_.cancel(request.deadline);
  request.stop_callback.reset();
  // The result hook runs before the future becomes ready; its failure is the
  // request's failure
  std::exception_ptr rejected;
  if (request.on_result) {
    try {
      request.on_result(result);
    } catch (...) {
      rejected = std::current_exception();
    }
  }
  if (rejected) {
    request.promise.set_exception(rejected);
  } else {
    request.promise.set_value(std::move(result));
  }
  runSettledHook(request);
}

void RequestCorrelator::settle(PendingRequest &request,
                               std::exception_ptr error) {
  scheduler_.cancel(request.deadline);
  request.stop_callback.reset();
  request.promise.set_exception(std::move(error));
  runSettledHook(request);
}

void RequestCorrelator::runSettledHook(PendingRequest &request) {
  if (!request.on_settled) {
    return;
  }
  try {
    request.on_settled();
  } catch (const std::exception &e) {
    MCPHUB_LOG_WARNING("[" + label_ + "] Completion hook failed: " + e.what());
  }
}

void RequestCorrelator::expire(const std::string &key,
                               std::chrono::milliseconds timeout) {
  auto entry = take(key);
  if (!entry) {
    return;
  }
  MCPHUB_LOG_WARNING("[" + label_ + "] Request " + key + " (" + entry->method +
                     ") timed out after " + std::to_string(timeout.count()) +
                     "ms");
  if (entry->cancellable) {
    sendCancelled(types::RequestId{key}, "Request timed out");
  }
  settle(*entry, std::make_exception_ptr(TimeoutException(
                     "Request timed out: " + entry->method,
                     {{"requestId", key}, {"timeout", timeout.count()}})));
}

void RequestCorrelator::sendCancelled(const types::RequestId &id,
                                      const std::optional<std::string> &reason) {
  types::CancelledParams params{id, reason};
  notifyBestEffort(methods::Cancelled, nlohmann::json(params));
}

} // namespace session
} // namespace mcphub
