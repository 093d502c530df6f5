#ifndef MCPHUB_CONFIG_HPP_
#define MCPHUB_CONFIG_HPP_

#include "mcphub/session/capability_negotiator.hpp"
#include "mcphub/session/task_coordinator.hpp"
#include "mcphub/transport/transport.hpp"
#include "mcphub/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

/**
 * @brief Where a server definition came from
 */
enum class ConfigSource { Global, Project };

std::string toString(ConfigSource source);

/**
 * @brief Transport a server definition asks for
 */
enum class TransportType { Stdio, Sse, StreamableHttp };

/**
 * @brief One server definition, as loaded by the host
 */
struct ServerConfig {
  std::string name;                           ///< Unique within a source
  ConfigSource source = ConfigSource::Global; ///< Definition scope
  TransportType type = TransportType::Stdio;  ///< Transport kind

  // Stdio
  std::string command;                       ///< Executable
  std::vector<std::string> args;             ///< Arguments
  std::map<std::string, std::string> env;    ///< Extra environment
  std::optional<std::string> cwd;            ///< Working directory

  // Sse / StreamableHttp
  std::string url;                            ///< Endpoint
  std::map<std::string, std::string> headers; ///< Extra HTTP headers

  bool disabled = false; ///< Listed but never connected
  /// Default deadline of requests to this server.
  std::optional<std::chrono::milliseconds> timeout;

  bool operator==(const ServerConfig &) const = default;
};

/**
 * @brief Creates the transport for a server definition
 *
 * Supplied by the host; may throw if the definition cannot be served.
 */
using TransportFactory =
    std::function<std::shared_ptr<transport::Transport>(const ServerConfig &)>;

/**
 * @brief Hub-wide settings
 */
struct HubConfig {
  types::Implementation client_info{"mcphub", "1.0.0"};
  bool enabled = true; ///< Global switch, false keeps every server listed only

  std::chrono::milliseconds handshake_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds default_request_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds restart_settle_delay{500};
  /// Bound for serving tasks/result to a peer.
  std::chrono::milliseconds inbound_result_timeout{std::chrono::minutes(5)};
  /// Poll interval for host approval futures.
  std::chrono::milliseconds host_poll_interval{50};

  session::TaskWaitOptions task_wait;
  session::ReceiverTaskConfig receiver_tasks;
  session::LocalCapabilityOptions capabilities;
};

} // namespace mcphub

#endif // MCPHUB_CONFIG_HPP_
