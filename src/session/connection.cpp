#include "mcphub/session/connection.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/ids.hpp"
#include "mcphub/utils/json_utils.hpp"
#include "mcphub/utils/logging.hpp"

namespace mcphub {
namespace session {

Connection::Connection(std::string name, std::string source,
                       std::shared_ptr<transport::Transport> transport,
                       const HubConfig &config,
                       std::chrono::milliseconds request_timeout,
                       NotificationRouter &router, HostLink &host,
                       Callbacks callbacks)
    : name_(std::move(name)), source_(std::move(source)),
      scope_(name_ + "@" + source_ + "#" + ids::newRequestId()),
      config_(config), request_timeout_(request_timeout),
      transport_(std::move(transport)), router_(router), host_(host),
      callbacks_(std::move(callbacks)),
      negotiator_(config.client_info, config.capabilities), progress_(name_),
      correlator_(transport_, scheduler_, name_),
      initiator_(
          [this](const std::string &method, const nlohmann::json &params) {
            return request(method, params);
          },
          progress_, scheduler_, name_),
      receiver_(
          scheduler_,
          [this](const types::TaskDescriptor &task) {
            correlator_.notify(methods::TaskStatus, nlohmann::json(task));
          },
          config.receiver_tasks, name_) {
  routes_.progress = [this](const types::ProgressParams &params) {
    progress_.onProgressEvent(params);
  };
  routes_.cancelled = [this](const types::CancelledParams &params) {
    correlator_.handleCancelledNotification(params);
  };
  routes_.task_status = [this](const types::TaskDescriptor &task) {
    initiator_.applyStatus(task, true);
  };
  routes_.log_message = [this](const types::LoggingMessageParams &params) {
    handleLogMessage(params);
  };
  routes_.list_changed = [this](NotificationKind kind) {
    if (kind == NotificationKind::ToolListChanged) {
      negotiator_.forgetTools();
    }
  };
}

Connection::~Connection() { close("Connection closed"); }

types::InitializeResult Connection::open() {
  if (closed_) {
    throw TransportException(types::ErrorCode::ConnectionClosed,
                             "Connection closed");
  }

  // Set up transport callbacks; they never extend the connection's lifetime
  std::weak_ptr<Connection> weak = weak_from_this();
  transport_->setMessageCallback([weak](types::JSONRPCMessage message) {
    if (auto self = weak.lock()) {
      self->handleMessage(message);
    }
  });
  transport_->setErrorCallback([weak](std::error_code error) {
    if (auto self = weak.lock()) {
      self->handleTransportError(error);
    }
  });
  transport_->setCloseCallback([weak]() {
    if (auto self = weak.lock()) {
      self->handleTransportClosed();
    }
  });

  // Connect the transport
  try {
    transport_->connect();
  } catch (const HubException &) {
    throw;
  } catch (const std::exception &e) {
    throw TransportException("Failed to connect to " + name_ + ": " +
                             e.what());
  }
  if (!transport_->isConnected()) {
    throw TransportException("Transport for " + name_ + " did not connect");
  }

  // Send initialize, check the answer, then send initialized
  RequestOptions options;
  options.timeout = config_.handshake_timeout;
  options.cancellable = false;
  auto handshake = correlator_.send(
      methods::Initialize, negotiator_.buildInitializeParams(), options);
  auto result = negotiator_.negotiate(handshake.result.get());
  correlator_.notify(methods::Initialized, std::nullopt);

  open_ = true;
  MCPHUB_LOG_INFO("[" + name_ + "] Connected to " + result.serverInfo.name +
                  " " + result.serverInfo.version + " (protocol " +
                  result.protocolVersion + ")");
  return result;
}

void Connection::close(const std::string &reason) {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true)) {
    return;
  }
  open_ = false;
  MCPHUB_LOG_DEBUG("[" + name_ + "] Closing: " + reason);

  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
    subscriptions_.clear();
  }
  for (auto &worker : workers) {
    worker.thread.request_stop();
  }

  // Settle everything that still waits on this connection
  correlator_.abortAll(reason);
  initiator_.failAll(reason);
  receiver_.failAll(reason);
  progress_.releaseAll();

  try {
    transport_->disconnect();
  } catch (const std::exception &e) {
    MCPHUB_LOG_WARNING("[" + name_ + "] Error closing transport: " + e.what());
  }

  // Join workers before the timers stop
  workers.clear();
  scheduler_.shutdown();
}

bool Connection::isOpen() const { return open_ && !closed_; }

void Connection::ensureOpen() const {
  if (closed_) {
    throw TransportException(types::ErrorCode::ConnectionClosed,
                             "Connection to " + name_ + " is closed");
  }
  if (!open_) {
    throw ProtocolException("Connection to " + name_ +
                            " is not initialized");
  }
}

PendingCall Connection::call(const std::string &method,
                             std::optional<nlohmann::json> params,
                             CallOptions options) {
  ensureOpen();

  if (options.as_task) {
    auto wait = options.task_wait.value_or(config_.task_wait);
    if (!wait.stop_token.stop_possible()) {
      wait.stop_token = options.stop_token;
    }
    options.as_task = false;
    auto created = callAsTask(method, std::move(params), std::move(options));
    auto self = shared_from_this();
    return {created.id,
            std::async(std::launch::deferred,
                       [self, wait,
                        future = std::move(created.result)]() mutable {
                         TaskCallResult outcome = future.get();
                         if (!outcome.task) {
                           return outcome.result;
                         }
                         return self->initiator_.awaitResult(
                             outcome.task->taskId, wait);
                       })};
  }

  RequestOptions request_options;
  request_options.id = correlator_.nextRequestId();
  request_options.timeout = options.timeout.value_or(request_timeout_);
  request_options.stop_token = options.stop_token;
  if (options.progress) {
    auto token = progress_.issueToken(
        {ProgressOwner::Kind::Request,
         types::requestIdToString(*request_options.id)},
        std::move(options.progress));
    request_options.progress_token = token;
    request_options.on_settled = [this, token]() { progress_.release(token); };
  }
  return correlator_.send(method, std::move(params),
                          std::move(request_options));
}

PendingTaskCall Connection::callAsTask(const std::string &method,
                                       std::optional<nlohmann::json> params,
                                       CallOptions options) {
  ensureOpen();

  std::string tool;
  if (method == methods::CallTool && params && params->contains("name") &&
      (*params)["name"].is_string()) {
    tool = (*params)["name"].get<std::string>();
  }

  // Fall back to a plain request when the peer cannot run it as a task
  if (!negotiator_.supportsTaskAugmentation(method, tool)) {
    MCPHUB_LOG_DEBUG("[" + name_ + "] " + method +
                     " cannot run as a task, sending a plain request");
    options.as_task = false;
    auto plain = call(method, std::move(params), std::move(options));
    return {plain.id, std::async(std::launch::deferred,
                                 [future = std::move(plain.result)]() mutable {
                                   return TaskCallResult{std::nullopt,
                                                         future.get()};
                                 })};
  }

  RequestOptions request_options;
  request_options.id = correlator_.nextRequestId();
  request_options.timeout = options.timeout.value_or(request_timeout_);
  request_options.stop_token = options.stop_token;
  auto token = progress_.issueToken(
      {ProgressOwner::Kind::Request,
       types::requestIdToString(*request_options.id)},
      std::move(options.progress));
  request_options.progress_token = token;

  // Track the task as soon as the CreateTaskResult arrives, so pushed
  // statuses and awaitTask work before anyone reads the future. The token
  // then belongs to the task; every other outcome releases it.
  auto handed_over = std::make_shared<std::atomic<bool>>(false);
  request_options.on_result = [this, token,
                               handed_over](const nlohmann::json &result) {
    if (!result.contains("task")) {
      return;
    }
    json_utils::validateOrThrow(result, json_utils::schemas::createTaskResult(),
                                "task creation result");
    initiator_.track(result["task"].get<types::TaskDescriptor>(), token);
    handed_over->store(true);
  };
  request_options.on_settled = [this, token, handed_over]() {
    if (!handed_over->load()) {
      progress_.release(token);
    }
  };

  nlohmann::json body = params.value_or(nlohmann::json::object());
  types::TaskMetadata metadata;
  if (options.task_ttl) {
    metadata.ttl = options.task_ttl->count();
  }
  body["task"] = metadata;

  auto pending =
      correlator_.send(method, std::move(body), std::move(request_options));
  return {pending.id,
          std::async(std::launch::deferred,
                     [future = std::move(pending.result)]() mutable {
                       nlohmann::json result = future.get();
                       if (!result.contains("task")) {
                         return TaskCallResult{std::nullopt, std::move(result)};
                       }
                       auto task = result["task"].get<types::TaskDescriptor>();
                       return TaskCallResult{std::move(task), std::move(result)};
                     })};
}

nlohmann::json Connection::request(const std::string &method,
                                   std::optional<nlohmann::json> params) {
  return call(method, std::move(params)).result.get();
}

bool Connection::cancel(const types::RequestId &id,
                        std::optional<std::string> reason) {
  return correlator_.cancel(id, std::move(reason));
}

std::vector<types::Tool> Connection::listTools() {
  negotiator_.require(Feature::Tools, methods::ListTools);

  std::vector<types::Tool> tools;
  std::optional<std::string> cursor;
  do {
    nlohmann::json params = nlohmann::json::object();
    if (cursor) {
      params["cursor"] = *cursor;
    }
    auto page = request(methods::ListTools, params);
    auto batch = page.value("tools", std::vector<types::Tool>{});
    tools.insert(tools.end(), batch.begin(), batch.end());
    cursor.reset();
    if (page.contains("nextCursor") && page["nextCursor"].is_string()) {
      cursor = page["nextCursor"].get<std::string>();
    }
  } while (cursor);

  negotiator_.recordTools(tools);
  return tools;
}

std::vector<types::ResourceTemplate> Connection::listResourceTemplates() {
  negotiator_.require(Feature::Resources, methods::ListResourceTemplates);

  std::vector<types::ResourceTemplate> templates;
  std::optional<std::string> cursor;
  do {
    nlohmann::json params = nlohmann::json::object();
    if (cursor) {
      params["cursor"] = *cursor;
    }
    auto page = request(methods::ListResourceTemplates, params);
    json_utils::validateOrThrow(
        page, json_utils::schemas::listResourceTemplatesResult(),
        "resource template list");
    auto batch =
        page["resourceTemplates"].get<std::vector<types::ResourceTemplate>>();
    templates.insert(templates.end(), batch.begin(), batch.end());
    cursor.reset();
    if (page.contains("nextCursor")) {
      cursor = page["nextCursor"].get<std::string>();
    }
  } while (cursor && !cursor->empty());

  return templates;
}

void Connection::subscribeResource(const std::string &uri) {
  negotiator_.require(Feature::ResourceSubscriptions,
                      methods::SubscribeResource);
  request(methods::SubscribeResource, nlohmann::json{{"uri", uri}});
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.insert(uri);
}

void Connection::unsubscribeResource(const std::string &uri) {
  negotiator_.require(Feature::ResourceSubscriptions,
                      methods::UnsubscribeResource);
  request(methods::UnsubscribeResource, nlohmann::json{{"uri", uri}});
  std::lock_guard<std::mutex> lock(mutex_);
  subscriptions_.erase(uri);
}

std::set<std::string> Connection::subscribedResources() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_;
}

void Connection::handleMessage(const types::JSONRPCMessage &message) {
  if (const auto *request = std::get_if<types::JSONRPCRequest>(&message)) {
    MCPHUB_LOG_DEBUG("[" + name_ + "] <- " + request->method + " (" +
                     types::requestIdToString(request->id) + ")");
    handleRequest(*request);
  } else if (const auto *notification =
                 std::get_if<types::JSONRPCNotification>(&message)) {
    router_.route(name_, source_, *notification, routes_);
  } else if (const auto *response =
                 std::get_if<types::JSONRPCResponse>(&message)) {
    correlator_.handleResponse(*response);
  } else if (const auto *error = std::get_if<types::JSONRPCError>(&message)) {
    correlator_.handleError(*error);
  }
}

void Connection::handleRequest(const types::JSONRPCRequest &request) {
  const nlohmann::json params =
      request.params.value_or(nlohmann::json::object());

  // Cheap requests are answered inline, anything that may block goes to a
  // worker
  try {
    if (request.method == methods::Ping) {
      respond(request.id, nlohmann::json::object());
    } else if (request.method == methods::ListRoots) {
      std::vector<types::Root> roots;
      if (auto host = host_.current()) {
        roots = host->roots();
      }
      respond(request.id, nlohmann::json{{"roots", roots}});
    } else if (request.method == methods::GetTask) {
      // tasks/* lookups are confined to this session's scope
      auto task =
          receiver_.get(params.at("taskId").get<std::string>(), scope_);
      respond(request.id, nlohmann::json(task));
    } else if (request.method == methods::ListTasks) {
      std::optional<std::string> cursor;
      if (params.contains("cursor") && params["cursor"].is_string()) {
        cursor = params["cursor"].get<std::string>();
      }
      respond(request.id, nlohmann::json(receiver_.list(scope_, cursor)));
    } else if (request.method == methods::CancelTask) {
      auto task =
          receiver_.cancel(params.at("taskId").get<std::string>(), scope_);
      respond(request.id, nlohmann::json(task));
    } else if (request.method == methods::TaskResult) {
      auto task_id = params.at("taskId").get<std::string>();
      serveAsync(request, [this, task_id](std::stop_token stop) {
        return receiver_.result(task_id, scope_, config_.inbound_result_timeout,
                                stop);
      });
    } else if (request.method == methods::Elicit ||
               request.method == methods::CreateMessage) {
      const bool elicitation = request.method == methods::Elicit;
      HostWork work = [this, params, elicitation](
                          std::stop_token stop,
                          const std::optional<std::string> &task_id) {
        return elicitation ? elicit(params, stop, task_id)
                           : sample(params, stop, task_id);
      };
      // Run as a task only if we advertised task support for the method
      if (params.contains("task") &&
          negotiator_.acceptsTaskRequest(request.method)) {
        serveAsTask(request, params["task"].get<types::TaskMetadata>(),
                    std::move(work));
      } else {
        serveAsync(request, [work](std::stop_token stop) {
          return work(stop, std::nullopt);
        });
      }
    } else {
      MCPHUB_LOG_DEBUG("[" + name_ + "] Unsupported request " +
                       request.method);
      respondError(request.id,
                   {static_cast<int>(types::ErrorCode::MethodNotFound),
                    "Method not found: " + request.method, nullptr});
    }
  } catch (const HubException &e) {
    respondError(request.id, e.error());
  } catch (const nlohmann::json::exception &e) {
    respondError(request.id,
                 {static_cast<int>(types::ErrorCode::InvalidParams),
                  std::string("Invalid params: ") + e.what(), nullptr});
  } catch (const std::exception &e) {
    respondError(request.id, {static_cast<int>(types::ErrorCode::InternalError),
                              e.what(), nullptr});
  }
}

void Connection::handleLogMessage(const types::LoggingMessageParams &params) {
  auto level = logging::levelFromProtocol(params.level);
  std::string text = params.data.is_string() ? params.data.get<std::string>()
                                             : params.data.dump();
  std::string message = "[" + name_ + "]" +
                        (params.logger ? " [" + *params.logger + "]" : "") +
                        " " + text;
  if (logging::isEnabled(level)) {
    logging::log(level, message);
  }
  if (level >= logging::Level::Warning && callbacks_.record_error) {
    callbacks_.record_error(text, level == logging::Level::Warning
                                      ? utils::ErrorLevel::Warn
                                      : utils::ErrorLevel::Error);
  }
}

void Connection::handleTransportError(const std::error_code &error) {
  MCPHUB_LOG_ERROR("[" + name_ + "] Transport error: " + error.message());
  if (callbacks_.record_error) {
    callbacks_.record_error("Transport error: " + error.message(),
                            utils::ErrorLevel::Error);
  }
  if (!closed_ && !transport_->isConnected() && callbacks_.lost) {
    callbacks_.lost("Transport error: " + error.message(), true);
  }
}

void Connection::handleTransportClosed() {
  if (closed_) {
    return;
  }
  MCPHUB_LOG_WARNING("[" + name_ + "] Transport closed by peer");
  if (callbacks_.lost) {
    callbacks_.lost("Transport closed", false);
  }
}

void Connection::serveAsync(const types::JSONRPCRequest &request,
                            std::function<nlohmann::json(std::stop_token)> work) {
  auto inbound = correlator_.registerInbound(request.id, request.method);
  const types::RequestId id = request.id;

  bool started = spawn([this, id, inbound, work](std::stop_token worker) {
    std::stop_source source;
    std::stop_callback on_peer_cancel(inbound,
                                      [&source]() { source.request_stop(); });
    std::stop_callback on_close(worker, [&source]() { source.request_stop(); });

    try {
      respond(id, work(source.get_token()));
    } catch (const CancelledException &e) {
      // A request the peer cancelled gets no response.
      if (!source.stop_requested()) {
        respondError(id, e.error());
      }
    } catch (const HubException &e) {
      respondError(id, e.error());
    } catch (const nlohmann::json::exception &e) {
      respondError(id, {static_cast<int>(types::ErrorCode::InvalidParams),
                        std::string("Invalid params: ") + e.what(), nullptr});
    } catch (const std::exception &e) {
      respondError(id, {static_cast<int>(types::ErrorCode::InternalError),
                        e.what(), nullptr});
    }
    correlator_.completeInbound(id);
  });

  if (!started) {
    correlator_.completeInbound(id);
  }
}

void Connection::serveAsTask(const types::JSONRPCRequest &request,
                             const types::TaskMetadata &metadata,
                             HostWork work) {
  // Take the work token with the record; a short TTL may purge it before
  // the worker starts
  std::stop_token task_stop;
  auto task = receiver_.create(scope_, metadata, &task_stop);
  respond(request.id, nlohmann::json{{"task", task}});

  const std::string task_id = task.taskId;
  bool started = spawn([this, task_id, task_stop,
                        work](std::stop_token worker) {
    std::stop_source source;
    std::stop_callback on_cancel(task_stop,
                                 [&source]() { source.request_stop(); });
    std::stop_callback on_close(worker, [&source]() { source.request_stop(); });

    // The outcome of the host call becomes the task's result
    std::optional<types::ErrorData> failure;
    try {
      receiver_.complete(task_id, work(source.get_token(), task_id));
    } catch (const HubException &e) {
      failure = e.error();
    } catch (const std::exception &e) {
      failure = types::ErrorData{
          static_cast<int>(types::ErrorCode::InternalError), e.what(), nullptr};
    }
    if (!failure) {
      return;
    }
    try {
      receiver_.fail(task_id, *failure);
    } catch (const HubException &e) {
      // Cancelled or purged while the host was working.
      MCPHUB_LOG_DEBUG("[" + name_ + "] Task " + task_id +
                       " not failed: " + e.what());
    }
  });

  if (!started) {
    MCPHUB_LOG_DEBUG("[" + name_ + "] Task " + task_id +
                     " not started, connection closing");
  }
}

nlohmann::json Connection::elicit(const nlohmann::json &params,
                                  std::stop_token stop,
                                  const std::optional<std::string> &task_id) {
  const nlohmann::json declined = {
      {"action", toString(ElicitationResponse::Action::Decline)}};

  auto host = host_.current();
  if (!host) {
    MCPHUB_LOG_DEBUG("[" + name_ + "] No host attached, declining elicitation");
    return declined;
  }
  if (params.value("mode", std::string("form")) == "url" ||
      !params.contains("requestedSchema")) {
    MCPHUB_LOG_DEBUG("[" + name_ + "] Declining unsupported elicitation mode");
    return declined;
  }

  if (task_id) {
    receiver_.transition(*task_id, types::TaskStatus::InputRequired,
                         params.value("message", std::string()));
  }
  auto response = awaitHost(host->elicit(name_, params), stop);

  nlohmann::json result = {{"action", toString(response.action)}};
  if (response.action == ElicitationResponse::Action::Accept &&
      !response.content.is_null()) {
    result["content"] = response.content;
  }
  return result;
}

nlohmann::json Connection::sample(const nlohmann::json &params,
                                  std::stop_token stop,
                                  const std::optional<std::string> &task_id) {
  auto host = host_.current();
  if (!host) {
    throw HubException(types::ErrorCode::InternalError,
                       "No host available for sampling");
  }

  if (task_id) {
    receiver_.transition(*task_id, types::TaskStatus::InputRequired,
                         "Awaiting sampling approval");
  }
  auto response = awaitHost(host->sample(name_, params), stop);
  if (!response.approved) {
    throw DeclinedException("User declined sampling request");
  }
  return response.result;
}

template <typename T>
T Connection::awaitHost(std::future<T> future, std::stop_token stop) {
  for (;;) {
    auto status = future.wait_for(config_.host_poll_interval);
    if (status != std::future_status::timeout) {
      return future.get();
    }
    if (stop.stop_requested()) {
      throw CancelledException("Cancelled while waiting for the host");
    }
  }
}

void Connection::respond(const types::RequestId &id, nlohmann::json result) {
  types::JSONRPCResponse response;
  response.id = id;
  response.result = std::move(result);
  std::error_code ec = transport_->send(response);
  if (ec) {
    MCPHUB_LOG_WARNING("[" + name_ + "] Failed to send response " +
                       types::requestIdToString(id) + ": " + ec.message());
  }
}

void Connection::respondError(const types::RequestId &id,
                              const types::ErrorData &error) {
  std::error_code ec = transport_->send(createErrorResponse(id, error));
  if (ec) {
    MCPHUB_LOG_WARNING("[" + name_ + "] Failed to send error response " +
                       types::requestIdToString(id) + ": " + ec.message());
  }
}

bool Connection::spawn(std::function<void(std::stop_token)> job) {
  reapWorkers();

  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return false;
  }
  auto done = std::make_shared<std::atomic<bool>>(false);
  workers_.push_back(
      {std::jthread([job = std::move(job), done](std::stop_token stop) {
         job(stop);
         *done = true;
       }),
       done});
  return true;
}

void Connection::reapWorkers() {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (*it->done) {
        auto next = std::next(it);
        finished.splice(finished.end(), workers_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  // Joined here, outside the lock.
}

} // namespace session
} // namespace mcphub
