#ifndef MCPHUB_TRANSPORT_TRANSPORT_HPP_
#define MCPHUB_TRANSPORT_TRANSPORT_HPP_

#include "mcphub/types.hpp"
#include <chrono>
#include <functional>
#include <system_error>

namespace mcphub {
namespace transport {

/**
 * @brief Duplex message channel to one tool server
 *
 * Concrete transports (child process over stdio, event stream, chunked HTTP)
 * live outside the hub and are handed to it by a TransportFactory. The hub
 * installs its callbacks before calling connect(). Callbacks may run on a
 * transport-owned thread; messages must be delivered in arrival order.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Send a message without waiting for the write to finish
   *
   * @param message The message to send
   * @param callback Invoked with the outcome of the write
   */
  virtual void send(const types::JSONRPCMessage &message,
                    std::function<void(const std::error_code &)> callback) = 0;

  /**
   * @brief Send a message and wait for the write to finish
   *
   * @param message The message to send
   * @param timeout Upper bound for the write
   * @return std::error_code Empty on success
   */
  virtual std::error_code
  send(const types::JSONRPCMessage &message,
       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) = 0;

  /**
   * @brief Set the callback for inbound messages
   */
  virtual void
  setMessageCallback(std::function<void(types::JSONRPCMessage)> callback) = 0;

  /**
   * @brief Set the callback for channel errors
   */
  virtual void
  setErrorCallback(std::function<void(std::error_code)> callback) = 0;

  /**
   * @brief Set the callback invoked once the channel has closed
   */
  virtual void setCloseCallback(std::function<void()> callback) = 0;

  /**
   * @brief Open the channel
   *
   * @throws std::exception if the channel cannot be opened
   */
  virtual void connect() = 0;

  /**
   * @brief Close the channel and release its resources
   */
  virtual void disconnect() = 0;

  /**
   * @brief Whether the channel is open
   */
  virtual bool isConnected() const = 0;
};

} // namespace transport
} // namespace mcphub

#endif // MCPHUB_TRANSPORT_TRANSPORT_HPP_
