#include "mcphub/registry.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/json_utils.hpp"
#include "mcphub/utils/logging.hpp"
#include "mcphub/utils/uri_template.hpp"

#include <set>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace mcphub {

std::string toString(ConfigSource source) {
  switch (source) {
  case ConfigSource::Global:
    return "global";
  case ConfigSource::Project:
    return "project";
  default:
    return "unknown";
  }
}

std::string toString(ConnectionStatus status) {
  switch (status) {
  case ConnectionStatus::Connecting:
    return "connecting";
  case ConnectionStatus::Connected:
    return "connected";
  case ConnectionStatus::Disconnected:
    return "disconnected";
  default:
    return "unknown";
  }
}

std::string toString(DisableReason reason) {
  switch (reason) {
  case DisableReason::ServerDisabled:
    return "server disabled";
  case DisableReason::HubDisabled:
    return "hub disabled";
  case DisableReason::Failed:
    return "failed";
  case DisableReason::Closed:
    return "closed";
  default:
    return "unknown";
  }
}

ConnectionRegistry::ConnectionRegistry(HubConfig config,
                                       TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)),
      enabled_(config_.enabled) {
  if (!factory_) {
    throw std::invalid_argument("ConnectionRegistry needs a transport factory");
  }
}

ConnectionRegistry::~ConnectionRegistry() { dispose(); }

void ConnectionRegistry::attachHost(const std::shared_ptr<Host> &host) {
  host_.attach(host);
}

void ConnectionRegistry::detachHost() { host_.detach(); }

void ConnectionRegistry::connect(const ServerConfig &config) {
  const ServerKey key{config.name, config.source};
  // Replace any existing entry for the same key
  remove(config.name, config.source);

  if (disposed_) {
    throw TransportException(types::ErrorCode::ConnectionClosed,
                             "Registry disposed");
  }
  // Disabled servers are listed but never get a transport
  if (config.disabled) {
    placeholder(config, DisableReason::ServerDisabled);
    return;
  }
  if (!enabled_) {
    placeholder(config, DisableReason::HubDisabled);
    return;
  }

  auto fail = [this, &key, &config](const std::string &message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto &entry = entries_[key];
      entry.config = config;
      entry.state = DisconnectedState{DisableReason::Failed, message};
      entry.errors.append(message, utils::ErrorLevel::Error);
    }
    MCPHUB_LOG_ERROR("[" + config.name + "] Failed to connect: " + message);
    publishStatus(key, ConnectionStatus::Disconnected, message);
  };

  // Create the transport
  std::shared_ptr<transport::Transport> transport;
  try {
    transport = factory_(config);
  } catch (const std::exception &e) {
    fail(e.what());
    throw;
  }
  if (!transport) {
    fail("No transport for " + config.name);
    throw TransportException("No transport for " + config.name);
  }

  // Wire the session back to its entry; the handle is weak so a lost
  // callback never keeps a retired session alive
  auto handle = std::make_shared<std::weak_ptr<session::Connection>>();
  session::Connection::Callbacks callbacks;
  callbacks.record_error = [this, key](const std::string &message,
                                       utils::ErrorLevel level) {
    record(key, message, level);
  };
  callbacks.lost = [this, key, handle](const std::string &reason,
                                       bool is_error) {
    onLost(key, *handle, reason, is_error);
  };

  auto connection = std::make_shared<session::Connection>(
      config.name, toString(config.source), std::move(transport), config_,
      config.timeout.value_or(config_.default_request_timeout), router_, host_,
      std::move(callbacks));
  *handle = connection;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entries_[key];
    entry.config = config;
    entry.state = ConnectingState{connection};
  }
  publishStatus(key, ConnectionStatus::Connecting);

  // Handshake outside the lock
  types::InitializeResult peer;
  try {
    peer = connection->open();
  } catch (const std::exception &e) {
    const std::string message = e.what();
    connection->close(message);
    bool current = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = entries_.find(key);
      current = it != entries_.end() &&
                sessionOf(it->second.state) == connection;
    }
    if (current) {
      fail(message);
    }
    throw;
  }

  // Promote to connected unless the entry was removed or replaced meanwhile
  bool replaced = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    replaced =
        it == entries_.end() || sessionOf(it->second.state) != connection;
    if (!replaced) {
      it->second.state = ConnectedState{connection, peer};
    }
  }
  if (replaced) {
    connection->close("Connection replaced");
    throw TransportException(types::ErrorCode::ConnectionClosed,
                             "Connection to " + config.name +
                                 " was removed while connecting");
  }
  publishStatus(key, ConnectionStatus::Connected);
}

bool ConnectionRegistry::remove(const std::string &name, ConfigSource source) {
  const ServerKey key{name, source};
  std::shared_ptr<session::Connection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    connection = sessionOf(it->second.state);
    entries_.erase(it);
  }

  if (connection) {
    connection->close("Connection removed");
    publishStatus(key, ConnectionStatus::Disconnected);
  }
  MCPHUB_LOG_INFO("[" + name + "] Removed (" + toString(source) + ")");
  return true;
}

void ConnectionRegistry::restart(const std::string &name, ConfigSource source) {
  const ServerKey key{name, source};
  ServerConfig config;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      MCPHUB_LOG_WARNING("Cannot restart unknown server " + name + " (" +
                         toString(source) + ")");
      return;
    }
    config = it->second.config;
    it->second.state = ConnectingState{sessionOf(it->second.state)};
  }
  publishStatus(key, ConnectionStatus::Connecting);

  // Give the old process time to exit before reconnecting
  std::this_thread::sleep_for(config_.restart_settle_delay);

  try {
    connect(config);
  } catch (const std::exception &e) {
    MCPHUB_LOG_ERROR("[" + name + "] Restart failed: " + e.what());
  }
}

std::vector<ConnectionSnapshot> ConnectionRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ConnectionSnapshot> result;
  result.reserve(entries_.size());
  for (const auto &[key, entry] : entries_) {
    result.push_back(snapshot(key, entry));
  }
  return result;
}

std::optional<ConnectionSnapshot>
ConnectionRegistry::find(const std::string &name, ConfigSource source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find({name, source});
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return snapshot(it->first, it->second);
}

void ConnectionRegistry::reconcile(const std::vector<ServerConfig> &configs,
                                   std::optional<ConfigSource> scope) {
  std::map<ServerKey, ServerConfig> desired;
  for (const auto &config : configs) {
    if (!scope || config.source == *scope) {
      desired[{config.name, config.source}] = config;
    }
  }

  // Diff under the lock, apply outside it
  std::vector<ServerKey> stale;
  std::vector<ServerConfig> changed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, entry] : entries_) {
      if ((!scope || key.second == *scope) && !desired.count(key)) {
        stale.push_back(key);
      }
    }
    for (const auto &[key, config] : desired) {
      auto it = entries_.find(key);
      if (it == entries_.end() || !(it->second.config == config)) {
        changed.push_back(config);
      }
    }
  }

  for (const auto &key : stale) {
    remove(key.first, key.second);
  }
  for (const auto &config : changed) {
    try {
      connect(config);
    } catch (const std::exception &e) {
      MCPHUB_LOG_WARNING("[" + config.name + "] Skipped during reconcile: " +
                         e.what());
    }
  }
}

void ConnectionRegistry::setEnabled(bool enabled) {
  if (enabled_.exchange(enabled) == enabled) {
    return;
  }
  MCPHUB_LOG_INFO(std::string("Hub ") + (enabled ? "enabled" : "disabled"));

  // Reconnecting turns every entry into a live session or a placeholder

  std::vector<ServerConfig> configs;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, entry] : entries_) {
      configs.push_back(entry.config);
    }
  }

  for (const auto &config : configs) {
    try {
      connect(config);
    } catch (const std::exception &e) {
      MCPHUB_LOG_WARNING("[" + config.name + "] " + e.what());
    }
  }
}

bool ConnectionRegistry::isEnabled() const { return enabled_; }

void ConnectionRegistry::dispose() {
  if (disposed_.exchange(true)) {
    return;
  }

  std::map<ServerKey, Entry> entries;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries.swap(entries_);
  }
  for (auto &[key, entry] : entries) {
    if (auto connection = sessionOf(entry.state)) {
      connection->close("Registry disposed");
    }
  }

  std::vector<std::future<void>> retired;
  {
    std::lock_guard<std::mutex> lock(retired_mutex_);
    retired.swap(retired_);
  }
  // Wait for sessions retired in the background
  for (auto &future : retired) {
    future.wait();
  }
  MCPHUB_LOG_DEBUG("Registry disposed");
}

session::PendingCall ConnectionRegistry::call(
    const std::string &name, ConfigSource source, const std::string &method,
    std::optional<nlohmann::json> params, session::CallOptions options) {
  return requireConnected(name, source)
      ->call(method, std::move(params), std::move(options));
}

session::PendingTaskCall ConnectionRegistry::callAsTask(
    const std::string &name, ConfigSource source, const std::string &method,
    std::optional<nlohmann::json> params, session::CallOptions options) {
  return requireConnected(name, source)
      ->callAsTask(method, std::move(params), std::move(options));
}

bool ConnectionRegistry::cancelRequest(const std::string &name,
                                       ConfigSource source,
                                       const types::RequestId &id,
                                       std::optional<std::string> reason) {
  std::shared_ptr<session::Connection> connection;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find({name, source});
    if (it != entries_.end()) {
      connection = sessionOf(it->second.state);
    }
  }
  if (!connection) {
    MCPHUB_LOG_DEBUG("[" + name + "] Ignoring cancel, not connected");
    return false;
  }
  return connection->cancel(id, std::move(reason));
}

types::TaskDescriptor ConnectionRegistry::getTask(const std::string &name,
                                                  ConfigSource source,
                                                  const std::string &task_id) {
  return requireConnected(name, source)->tasks().get(task_id);
}

nlohmann::json
ConnectionRegistry::awaitTask(const std::string &name, ConfigSource source,
                              const std::string &task_id,
                              std::optional<session::TaskWaitOptions> wait) {
  return requireConnected(name, source)
      ->tasks()
      .awaitResult(task_id, wait.value_or(config_.task_wait));
}

nlohmann::json ConnectionRegistry::taskResult(const std::string &name,
                                              ConfigSource source,
                                              const std::string &task_id) {
  return requireConnected(name, source)->tasks().result(task_id);
}

types::ListTasksResult
ConnectionRegistry::listTasks(const std::string &name, ConfigSource source,
                              const std::optional<std::string> &cursor) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::TaskList,
                                   methods::ListTasks);
  return connection->tasks().list(cursor);
}

types::TaskDescriptor
ConnectionRegistry::cancelTask(const std::string &name, ConfigSource source,
                               const std::string &task_id) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::TaskCancel,
                                   methods::CancelTask);
  return connection->tasks().cancel(task_id);
}

void ConnectionRegistry::ping(const std::string &name, ConfigSource source) {
  requireConnected(name, source)->request(methods::Ping, std::nullopt);
}

void ConnectionRegistry::setLoggingLevel(const std::string &name,
                                         ConfigSource source,
                                         const std::string &level) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Logging,
                                   methods::SetLoggingLevel);
  connection->request(methods::SetLoggingLevel, nlohmann::json{{"level", level}});
}

std::vector<types::Tool> ConnectionRegistry::listTools(const std::string &name,
                                                       ConfigSource source) {
  return requireConnected(name, source)->listTools();
}

nlohmann::json
ConnectionRegistry::listResources(const std::string &name, ConfigSource source,
                                  const std::optional<std::string> &cursor) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Resources,
                                   methods::ListResources);
  nlohmann::json params = nlohmann::json::object();
  if (cursor) {
    params["cursor"] = *cursor;
  }
  return connection->request(methods::ListResources, params);
}

nlohmann::json ConnectionRegistry::readResource(const std::string &name,
                                                ConfigSource source,
                                                const std::string &uri) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Resources,
                                   methods::ReadResource);
  return connection->request(methods::ReadResource, nlohmann::json{{"uri", uri}});
}

std::vector<types::ResourceTemplate>
ConnectionRegistry::listResourceTemplates(const std::string &name,
                                          ConfigSource source) {
  return requireConnected(name, source)->listResourceTemplates();
}

nlohmann::json ConnectionRegistry::readResourceFromTemplate(
    const std::string &name, ConfigSource source,
    const std::string &uri_template, const nlohmann::json &variables) {
  // Expand first so a malformed template never reaches the wire
  auto uri = uri_template::expand(uri_template, variables);
  MCPHUB_LOG_DEBUG("[" + name + "] " + uri_template + " expanded to " + uri);
  return readResource(name, source, uri);
}

nlohmann::json
ConnectionRegistry::listPrompts(const std::string &name, ConfigSource source,
                                const std::optional<std::string> &cursor) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Prompts,
                                   methods::ListPrompts);
  nlohmann::json params = nlohmann::json::object();
  if (cursor) {
    params["cursor"] = *cursor;
  }
  return connection->request(methods::ListPrompts, params);
}

nlohmann::json ConnectionRegistry::getPrompt(const std::string &name,
                                             ConfigSource source,
                                             const std::string &prompt,
                                             const nlohmann::json &arguments) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Prompts,
                                   methods::GetPrompt);
  return connection->request(
      methods::GetPrompt,
      nlohmann::json{{"name", prompt}, {"arguments", arguments}});
}

types::Completion ConnectionRegistry::complete(
    const std::string &name, ConfigSource source, const nlohmann::json &ref,
    const std::string &argument, const std::string &value,
    const std::optional<std::map<std::string, std::string>> &context) {
  auto connection = requireConnected(name, source);
  connection->negotiator().require(session::Feature::Completions,
                                   methods::Complete);

  nlohmann::json params = {{"ref", ref},
                           {"argument", {{"name", argument}, {"value", value}}}};
  if (context) {
    params["context"] = {{"arguments", *context}};
  }
  auto result = connection->request(methods::Complete, params);
  json_utils::validateOrThrow(result, json_utils::schemas::completeResult(),
                              "completion result");
  return result["completion"].get<types::Completion>();
}

void ConnectionRegistry::subscribeResource(const std::string &name,
                                           ConfigSource source,
                                           const std::string &uri) {
  requireConnected(name, source)->subscribeResource(uri);
}

void ConnectionRegistry::unsubscribeResource(const std::string &name,
                                             ConfigSource source,
                                             const std::string &uri) {
  requireConnected(name, source)->unsubscribeResource(uri);
}

std::set<std::string>
ConnectionRegistry::subscribedResources(const std::string &name,
                                        ConfigSource source) const {
  return requireConnected(name, source)->subscribedResources();
}

void ConnectionRegistry::notifyRootsListChanged() {
  std::vector<std::shared_ptr<session::Connection>> connected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, entry] : entries_) {
      if (const auto *state = std::get_if<ConnectedState>(&entry.state)) {
        connected.push_back(state->session);
      }
    }
  }
  for (const auto &connection : connected) {
    connection->correlator().notifyBestEffort(methods::RootsListChanged,
                                              std::nullopt);
  }
}

session::SubscriptionId
ConnectionRegistry::subscribe(session::NotificationKind kind,
                              session::NotificationObserver observer) {
  return router_.subscribe(kind, std::move(observer));
}

bool ConnectionRegistry::unsubscribe(session::SubscriptionId id) {
  return router_.unsubscribe(id);
}

std::shared_ptr<session::Connection>
ConnectionRegistry::sessionOf(const ConnectionState &state) {
  return std::visit(
      [](const auto &s) -> std::shared_ptr<session::Connection> {
        using State = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<State, DisconnectedState>) {
          return nullptr;
        } else {
          return s.session;
        }
      },
      state);
}

ConnectionSnapshot ConnectionRegistry::snapshot(const ServerKey &key,
                                                const Entry &entry) {
  ConnectionSnapshot result;
  result.name = key.first;
  result.source = key.second;
  result.errors.assign(entry.errors.entries().begin(),
                       entry.errors.entries().end());
  if (auto last = entry.errors.last()) {
    result.last_error = last->message;
  }

  if (std::holds_alternative<ConnectingState>(entry.state)) {
    result.status = ConnectionStatus::Connecting;
  } else if (const auto *connected =
                 std::get_if<ConnectedState>(&entry.state)) {
    result.status = ConnectionStatus::Connected;
    result.server_info = connected->peer.serverInfo;
    result.protocol_version = connected->peer.protocolVersion;
    result.instructions = connected->peer.instructions;
    result.capabilities = connected->peer.capabilities;
  } else {
    const auto &disconnected = std::get<DisconnectedState>(entry.state);
    result.status = ConnectionStatus::Disconnected;
    result.reason = disconnected.reason;
    result.disabled = disconnected.reason == DisableReason::ServerDisabled ||
                      disconnected.reason == DisableReason::HubDisabled;
    if (disconnected.error) {
      result.last_error = disconnected.error;
    }
  }
  return result;
}

std::shared_ptr<session::Connection>
ConnectionRegistry::requireConnected(const std::string &name,
                                     ConfigSource source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find({name, source});
  if (it == entries_.end()) {
    throw TransportException("Unknown server " + name + " (" +
                             toString(source) + ")");
  }
  const auto *connected = std::get_if<ConnectedState>(&it->second.state);
  if (!connected) {
    throw TransportException("Server " + name + " (" + toString(source) +
                             ") is not connected");
  }
  return connected->session;
}

void ConnectionRegistry::placeholder(const ServerConfig &config,
                                     DisableReason reason) {
  const ServerKey key{config.name, config.source};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &entry = entries_[key];
    entry.config = config;
    entry.state = DisconnectedState{reason, std::nullopt};
  }
  MCPHUB_LOG_DEBUG("[" + config.name + "] Listed without connecting: " +
                   toString(reason));
  publishStatus(key, ConnectionStatus::Disconnected);
}

void ConnectionRegistry::record(const ServerKey &key,
                                const std::string &message,
                                utils::ErrorLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second.errors.append(message, level);
  }
}

void ConnectionRegistry::onLost(
    const ServerKey &key, const std::weak_ptr<session::Connection> &session,
    const std::string &reason, bool is_error) {
  auto connection = session.lock();
  if (!connection) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || sessionOf(it->second.state) != connection) {
      return;
    }
    it->second.state = DisconnectedState{
        is_error ? DisableReason::Failed : DisableReason::Closed, reason};
    if (is_error) {
      it->second.errors.append(reason, utils::ErrorLevel::Error);
    }
  }
  publishStatus(key, ConnectionStatus::Disconnected, reason);
  retire(std::move(connection), reason);
}

void ConnectionRegistry::retire(std::shared_ptr<session::Connection> session,
                                const std::string &reason) {
  std::lock_guard<std::mutex> lock(retired_mutex_);
  std::erase_if(retired_, [](const std::future<void> &future) {
    return future.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  });
  retired_.push_back(std::async(std::launch::async,
                                [session = std::move(session), reason]() {
                                  session->close(reason);
                                }));
}

void ConnectionRegistry::publishStatus(const ServerKey &key,
                                       ConnectionStatus status,
                                       const std::optional<std::string> &error) {
  session::Notification notification;
  notification.connection = key.first;
  notification.source = toString(key.second);
  notification.kind = session::NotificationKind::ConnectionStatus;
  notification.method = "hub/connectionStatus";
  notification.params = {{"status", toString(status)}};
  if (error) {
    notification.params["error"] = *error;
  }
  router_.publish(notification);
}

} // namespace mcphub
