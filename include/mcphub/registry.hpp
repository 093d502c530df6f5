#ifndef MCPHUB_REGISTRY_HPP_
#define MCPHUB_REGISTRY_HPP_

#include "mcphub/config.hpp"
#include "mcphub/host.hpp"
#include "mcphub/session/connection.hpp"
#include "mcphub/session/notification_router.hpp"
#include "mcphub/utils/error_history.hpp"

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mcphub {

enum class ConnectionStatus { Connecting, Connected, Disconnected };

std::string toString(ConnectionStatus status);

/**
 * @brief Why an entry is disconnected
 */
enum class DisableReason {
  ServerDisabled, ///< The server config is disabled
  HubDisabled,    ///< The hub is globally disabled
  Failed,         ///< Connecting failed or the transport reported an error
  Closed          ///< The peer closed the transport
};

std::string toString(DisableReason reason);

/**
 * @brief Read-only view of a registry entry
 */
struct ConnectionSnapshot {
  std::string name;
  ConfigSource source = ConfigSource::Global;
  ConnectionStatus status = ConnectionStatus::Disconnected;
  bool disabled = false; ///< Listed as a placeholder, never connected
  std::optional<DisableReason> reason;
  std::optional<types::Implementation> server_info;
  std::optional<std::string> protocol_version;
  std::optional<std::string> instructions;
  nlohmann::json capabilities;
  std::vector<utils::ErrorEntry> errors;
  std::optional<std::string> last_error;
};

/**
 * @brief Owns one live session per (name, source) and routes every host
 * operation to it
 *
 * All methods are thread-safe. Connection failures are recorded in the
 * entry's error history; only the operation that caused them throws.
 */
class ConnectionRegistry {
public:
  ConnectionRegistry(HubConfig config, TransportFactory factory);
  ~ConnectionRegistry();

  ConnectionRegistry(const ConnectionRegistry &) = delete;
  ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

  /**
   * @brief Attach the collaborator answering roots, elicitation and sampling
   */
  void attachHost(const std::shared_ptr<Host> &host);
  void detachHost();

  /**
   * @brief Connect a server, replacing any existing entry with the same key
   *
   * Disabled servers, or every server while the hub is disabled, are listed
   * as placeholders without a transport.
   *
   * @throws TransportException, ProtocolException, TimeoutException if the
   * transport or the handshake fails; the entry then stays disconnected
   */
  void connect(const ServerConfig &config);

  /**
   * @brief Close and forget a server
   *
   * @return false if no entry exists
   */
  bool remove(const std::string &name, ConfigSource source);

  /**
   * @brief Reconnect a server after restart_settle_delay
   */
  void restart(const std::string &name, ConfigSource source);

  std::vector<ConnectionSnapshot> list() const;
  std::optional<ConnectionSnapshot> find(const std::string &name,
                                         ConfigSource source) const;

  /**
   * @brief Bring the registry in line with a set of server configs
   *
   * Entries missing from @p configs are removed, new or changed configs are
   * connected. With @p scope set only entries of that source are considered.
   * Failures are recorded per server and never thrown.
   */
  void reconcile(const std::vector<ServerConfig> &configs,
                 std::optional<ConfigSource> scope = std::nullopt);

  /**
   * @brief Globally enable or disable the hub
   */
  void setEnabled(bool enabled);
  bool isEnabled() const;

  /**
   * @brief Close every connection, idempotent
   */
  void dispose();

  session::PendingCall call(const std::string &name, ConfigSource source,
                            const std::string &method,
                            std::optional<nlohmann::json> params,
                            session::CallOptions options = {});
  session::PendingTaskCall callAsTask(const std::string &name,
                                      ConfigSource source,
                                      const std::string &method,
                                      std::optional<nlohmann::json> params,
                                      session::CallOptions options = {});
  bool cancelRequest(const std::string &name, ConfigSource source,
                     const types::RequestId &id,
                     std::optional<std::string> reason = std::nullopt);

  types::TaskDescriptor getTask(const std::string &name, ConfigSource source,
                                const std::string &task_id);
  nlohmann::json
  awaitTask(const std::string &name, ConfigSource source,
            const std::string &task_id,
            std::optional<session::TaskWaitOptions> wait = std::nullopt);
  nlohmann::json taskResult(const std::string &name, ConfigSource source,
                            const std::string &task_id);
  types::ListTasksResult
  listTasks(const std::string &name, ConfigSource source,
            const std::optional<std::string> &cursor = std::nullopt);
  types::TaskDescriptor cancelTask(const std::string &name,
                                   ConfigSource source,
                                   const std::string &task_id);

  void ping(const std::string &name, ConfigSource source);
  /// @param level Syslog level name, e.g. "warning"
  void setLoggingLevel(const std::string &name, ConfigSource source,
                       const std::string &level);
  std::vector<types::Tool> listTools(const std::string &name,
                                     ConfigSource source);
  nlohmann::json
  listResources(const std::string &name, ConfigSource source,
                const std::optional<std::string> &cursor = std::nullopt);
  nlohmann::json readResource(const std::string &name, ConfigSource source,
                              const std::string &uri);
  std::vector<types::ResourceTemplate>
  listResourceTemplates(const std::string &name, ConfigSource source);

  /**
   * @brief Expand a resource template and read the resulting URI
   *
   * @param variables Values for the template's variables
   * @throws ProtocolException if the template is malformed
   */
  nlohmann::json readResourceFromTemplate(const std::string &name,
                                          ConfigSource source,
                                          const std::string &uri_template,
                                          const nlohmann::json &variables);
  nlohmann::json
  listPrompts(const std::string &name, ConfigSource source,
              const std::optional<std::string> &cursor = std::nullopt);
  nlohmann::json getPrompt(const std::string &name, ConfigSource source,
                           const std::string &prompt,
                           const nlohmann::json &arguments = nlohmann::json::object());

  /**
   * @brief Ask the server to complete an argument value
   *
   * @param ref A "ref/prompt" or "ref/resource" reference
   * @param context Values of arguments that are already resolved
   * @throws CapabilityException if the server does not offer completions
   */
  types::Completion
  complete(const std::string &name, ConfigSource source,
           const nlohmann::json &ref, const std::string &argument,
           const std::string &value,
           const std::optional<std::map<std::string, std::string>> &context =
               std::nullopt);

  void subscribeResource(const std::string &name, ConfigSource source,
                         const std::string &uri);
  void unsubscribeResource(const std::string &name, ConfigSource source,
                           const std::string &uri);
  std::set<std::string> subscribedResources(const std::string &name,
                                            ConfigSource source) const;

  /**
   * @brief Tell every connected server that the roots changed
   */
  void notifyRootsListChanged();

  session::SubscriptionId subscribe(session::NotificationKind kind,
                                    session::NotificationObserver observer);
  bool unsubscribe(session::SubscriptionId id);

private:
  using ServerKey = std::pair<std::string, ConfigSource>;

  struct ConnectingState {
    std::shared_ptr<session::Connection> session; ///< Null while restarting
  };
  struct ConnectedState {
    std::shared_ptr<session::Connection> session;
    types::InitializeResult peer;
  };
  struct DisconnectedState {
    DisableReason reason = DisableReason::Failed;
    std::optional<std::string> error;
  };
  using ConnectionState =
      std::variant<ConnectingState, ConnectedState, DisconnectedState>;

  struct Entry {
    ServerConfig config;
    ConnectionState state;
    utils::ErrorHistory errors{};
  };

  static std::shared_ptr<session::Connection>
  sessionOf(const ConnectionState &state);
  static ConnectionSnapshot snapshot(const ServerKey &key, const Entry &entry);

  std::shared_ptr<session::Connection> requireConnected(const std::string &name,
                                                        ConfigSource source) const;
  void placeholder(const ServerConfig &config, DisableReason reason);
  void record(const ServerKey &key, const std::string &message,
              utils::ErrorLevel level);
  void onLost(const ServerKey &key,
              const std::weak_ptr<session::Connection> &session,
              const std::string &reason, bool is_error);
  void retire(std::shared_ptr<session::Connection> session,
              const std::string &reason);
  void publishStatus(const ServerKey &key, ConnectionStatus status,
                     const std::optional<std::string> &error = std::nullopt);

  const HubConfig config_;
  TransportFactory factory_;
  session::NotificationRouter router_;
  HostLink host_;

  std::atomic<bool> enabled_;
  std::atomic<bool> disposed_{false};

  mutable std::mutex mutex_; ///< Guards entries_
  std::map<ServerKey, Entry> entries_;

  std::mutex retired_mutex_;
  std::vector<std::future<void>> retired_;
};

} // namespace mcphub

#endif // MCPHUB_REGISTRY_HPP_
