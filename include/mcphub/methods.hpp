#ifndef MCPHUB_METHODS_HPP_
#define MCPHUB_METHODS_HPP_

namespace mcphub {
namespace methods {

// Lifecycle
constexpr const char *Initialize = "initialize";
constexpr const char *Initialized = "notifications/initialized";
constexpr const char *Ping = "ping";

// Server features
constexpr const char *ListTools = "tools/list";
constexpr const char *CallTool = "tools/call";
constexpr const char *ListResources = "resources/list";
constexpr const char *ReadResource = "resources/read";
constexpr const char *ListResourceTemplates = "resources/templates/list";
constexpr const char *SubscribeResource = "resources/subscribe";
constexpr const char *UnsubscribeResource = "resources/unsubscribe";
constexpr const char *ListPrompts = "prompts/list";
constexpr const char *GetPrompt = "prompts/get";
constexpr const char *SetLoggingLevel = "logging/setLevel";
constexpr const char *Complete = "completion/complete";

// Tasks, served by either side
constexpr const char *GetTask = "tasks/get";
constexpr const char *TaskResult = "tasks/result";
constexpr const char *ListTasks = "tasks/list";
constexpr const char *CancelTask = "tasks/cancel";

// Client features requested by servers
constexpr const char *CreateMessage = "sampling/createMessage";
constexpr const char *Elicit = "elicitation/create";
constexpr const char *ListRoots = "roots/list";

// Notifications
constexpr const char *Progress = "notifications/progress";
constexpr const char *Cancelled = "notifications/cancelled";
constexpr const char *TaskStatus = "notifications/tasks/status";
constexpr const char *LogMessage = "notifications/message";
constexpr const char *ToolListChanged = "notifications/tools/list_changed";
constexpr const char *ResourceListChanged =
    "notifications/resources/list_changed";
constexpr const char *PromptListChanged = "notifications/prompts/list_changed";
constexpr const char *ResourceUpdated = "notifications/resources/updated";
constexpr const char *RootsListChanged = "notifications/roots/list_changed";

} // namespace methods
} // namespace mcphub

#endif // MCPHUB_METHODS_HPP_
