#ifndef MCPHUB_SESSION_NOTIFICATION_ROUTER_HPP_
#define MCPHUB_SESSION_NOTIFICATION_ROUTER_HPP_

#include "mcphub/types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace mcphub {
namespace session {

/**
 * @brief Kinds of out-of-band messages observers can subscribe to
 */
enum class NotificationKind {
  Progress,
  Cancelled,
  TaskStatus,
  LogMessage,
  ToolListChanged,
  ResourceListChanged,
  PromptListChanged,
  ResourceUpdated,
  ConnectionStatus, ///< Published by the registry, never sent by peers
  Unknown
};

NotificationKind kindFromMethod(const std::string &method);
std::string toString(NotificationKind kind);

/**
 * @brief A notification as delivered to observers
 */
struct Notification {
  std::string connection; ///< Server name
  std::string source;     ///< Configuration source of the server
  NotificationKind kind = NotificationKind::Unknown;
  std::string method;    ///< Wire method, or a hub/ name for hub events
  nlohmann::json params; ///< Raw params
};

using NotificationObserver = std::function<void(const Notification &)>;
using SubscriptionId = std::uint64_t;

/**
 * @brief Owners of the notifications that change tracker state
 *
 * Each route is a method of the owning component, bound by the connection.
 */
struct InlineRoutes {
  std::function<void(const types::ProgressParams &)> progress;
  std::function<void(const types::CancelledParams &)> cancelled;
  std::function<void(const types::TaskDescriptor &)> task_status;
  std::function<void(const types::LoggingMessageParams &)> log_message;
  std::function<void(NotificationKind)> list_changed;
};

/**
 * @brief Dispatches inbound notifications
 *
 * Notifications that change tracker state are validated and handed to their
 * owner first, then every notification is fanned out to the observers of
 * its kind. A failing observer is logged and does not affect the others.
 */
class NotificationRouter {
public:
  NotificationRouter() = default;

  NotificationRouter(const NotificationRouter &) = delete;
  NotificationRouter &operator=(const NotificationRouter &) = delete;

  /**
   * @brief Register an observer for one kind
   *
   * @return SubscriptionId Handle for unsubscribe()
   */
  SubscriptionId subscribe(NotificationKind kind,
                           NotificationObserver observer);

  /**
   * @brief Remove an observer
   *
   * @return false if the id is unknown
   */
  bool unsubscribe(SubscriptionId id);

  /**
   * @brief Route a notification received from a peer
   *
   * @param connection Server name
   * @param source Configuration source of the server
   * @param notification The notification
   * @param routes Owners of tracker-changing notifications
   * @return false if the notification was malformed or unknown
   */
  bool route(const std::string &connection, const std::string &source,
             const types::JSONRPCNotification &notification,
             const InlineRoutes &routes);

  /**
   * @brief Deliver a notification to observers only
   */
  void publish(const Notification &notification);

  std::size_t subscriberCount(NotificationKind kind) const;

private:
  struct Subscription {
    NotificationKind kind;
    NotificationObserver observer;
  };

  mutable std::mutex mutex_;
  std::map<SubscriptionId, Subscription> subscriptions_;
  SubscriptionId next_id_ = 1;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_NOTIFICATION_ROUTER_HPP_
