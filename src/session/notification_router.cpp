#include "mcphub/session/notification_router.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/json_utils.hpp"
#include "mcphub/utils/logging.hpp"

#include <vector>

namespace mcphub {
namespace session {

NotificationKind kindFromMethod(const std::string &method) {
  static const std::map<std::string, NotificationKind> kinds = {
      {methods::Progress, NotificationKind::Progress},
      {methods::Cancelled, NotificationKind::Cancelled},
      {methods::TaskStatus, NotificationKind::TaskStatus},
      {methods::LogMessage, NotificationKind::LogMessage},
      {methods::ToolListChanged, NotificationKind::ToolListChanged},
      {methods::ResourceListChanged, NotificationKind::ResourceListChanged},
      {methods::PromptListChanged, NotificationKind::PromptListChanged},
      {methods::ResourceUpdated, NotificationKind::ResourceUpdated},
  };
  auto it = kinds.find(method);
  return it == kinds.end() ? NotificationKind::Unknown : it->second;
}

std::string toString(NotificationKind kind) {
  switch (kind) {
  case NotificationKind::Progress:
    return "progress";
  case NotificationKind::Cancelled:
    return "cancelled";
  case NotificationKind::TaskStatus:
    return "task_status";
  case NotificationKind::LogMessage:
    return "log_message";
  case NotificationKind::ToolListChanged:
    return "tool_list_changed";
  case NotificationKind::ResourceListChanged:
    return "resource_list_changed";
  case NotificationKind::PromptListChanged:
    return "prompt_list_changed";
  case NotificationKind::ResourceUpdated:
    return "resource_updated";
  case NotificationKind::ConnectionStatus:
    return "connection_status";
  case NotificationKind::Unknown:
    break;
  }
  return "unknown";
}

SubscriptionId NotificationRouter::subscribe(NotificationKind kind,
                                             NotificationObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  subscriptions_.emplace(id, Subscription{kind, std::move(observer)});
  return id;
}

bool NotificationRouter::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscriptions_.erase(id) > 0;
}

bool NotificationRouter::route(const std::string &connection,
                               const std::string &source,
                               const types::JSONRPCNotification &notification,
                               const InlineRoutes &routes) {
  Notification event;
  event.connection = connection;
  event.source = source;
  event.kind = kindFromMethod(notification.method);
  event.method = notification.method;
  event.params = notification.params.value_or(nlohmann::json::object());

  try {
    switch (event.kind) {
    case NotificationKind::Progress: {
      auto params = json_utils::decode<types::ProgressParams>(
          event.params, json_utils::schemas::progressParams(),
          "progress notification");
      if (routes.progress) {
        routes.progress(params);
      }
      break;
    }
    case NotificationKind::Cancelled: {
      auto params = json_utils::decode<types::CancelledParams>(
          event.params, json_utils::schemas::cancelledParams(),
          "cancellation notification");
      if (routes.cancelled) {
        routes.cancelled(params);
      }
      break;
    }
    case NotificationKind::TaskStatus: {
      auto params = json_utils::decode<types::TaskDescriptor>(
          event.params, json_utils::schemas::taskDescriptor(),
          "task status notification");
      if (routes.task_status) {
        routes.task_status(params);
      }
      break;
    }
    case NotificationKind::LogMessage:
      if (routes.log_message) {
        routes.log_message(event.params.get<types::LoggingMessageParams>());
      }
      break;
    case NotificationKind::ToolListChanged:
    case NotificationKind::ResourceListChanged:
    case NotificationKind::PromptListChanged:
      if (routes.list_changed) {
        routes.list_changed(event.kind);
      }
      break;
    case NotificationKind::ResourceUpdated:
      break;
    default:
      MCPHUB_LOG_DEBUG("[" + connection + "] Unhandled notification " +
                       notification.method);
      return false;
    }
  } catch (const ProtocolException &e) {
    MCPHUB_LOG_WARNING("[" + connection + "] Dropping " + notification.method +
                       ": " + e.what());
    return false;
  } catch (const nlohmann::json::exception &e) {
    MCPHUB_LOG_WARNING("[" + connection + "] Dropping " + notification.method +
                       ": " + e.what());
    return false;
  }

  publish(event);
  return true;
}

void NotificationRouter::publish(const Notification &notification) {
  std::vector<NotificationObserver> observers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, subscription] : subscriptions_) {
      if (subscription.kind == notification.kind) {
        observers.push_back(subscription.observer);
      }
    }
  }

  for (const auto &observer : observers) {
    try {
      observer(notification);
    } catch (const std::exception &e) {
      MCPHUB_LOG_WARNING("Observer for " + toString(notification.kind) +
                         " from " + notification.connection +
                         " failed: " + e.what());
    }
  }
}

std::size_t NotificationRouter::subscriberCount(NotificationKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &[id, subscription] : subscriptions_) {
    if (subscription.kind == kind) {
      ++count;
    }
  }
  return count;
}

} // namespace session
} // namespace mcphub
