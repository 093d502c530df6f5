#ifndef MCPHUB_TYPES_HPP_
#define MCPHUB_TYPES_HPP_

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace mcphub {

/// Protocol revision advertised during the handshake.
constexpr const char *kProtocolVersion = "2025-11-25";

namespace types {

/**
 * @brief Standard JSON-RPC 2.0 error codes and hub-specific error codes
 */
enum class ErrorCode {
  // JSON-RPC 2.0 standard error codes
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< The JSON sent is not a valid Request object
  MethodNotFound = -32601, ///< The method does not exist / is not available
  InvalidParams = -32602,  ///< Invalid method parameter(s)
  InternalError = -32603,  ///< Internal JSON-RPC error

  // Hub-specific error codes
  ProtocolError = -32000,         ///< Malformed or unexpected peer message
  TransportError = -32001,        ///< Transport-related error
  TimeoutError = -32002,          ///< Operation timed out
  CapabilityError = -32003,       ///< Peer did not negotiate the feature
  ConnectionClosed = -32004,      ///< Connection torn down while pending
  Declined = -32005,              ///< Host declined the request
  TaskNotFound = -32006,          ///< Unknown, expired or foreign task
  InvalidTaskTransition = -32007, ///< Status change not allowed
  NotCancellable = -32008,        ///< Request may not be cancelled
  TaskFailed = -32009,            ///< Task reached the failed status
  InputRequired = -32010,         ///< Task is waiting for input

  RequestCancelled = -32800 ///< Request was cancelled
};

/**
 * @brief Structure representing an error in JSON-RPC 2.0
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data
};

/**
 * @brief JSON-RPC request identifier
 */
using RequestId = std::variant<std::string, int>;

/**
 * @brief Render a request id as a map key
 */
inline std::string requestIdToString(const RequestId &id) {
  if (const auto *s = std::get_if<std::string>(&id)) {
    return *s;
  }
  return std::to_string(std::get<int>(id));
}

/**
 * @brief JSON-RPC 2.0 request message
 */
struct JSONRPCRequest {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  RequestId id;                         ///< Request identifier
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 notification message (request without id)
 */
struct JSONRPCNotification {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 success response message
 */
struct JSONRPCResponse {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  nlohmann::json result;       ///< Result data
};

/**
 * @brief JSON-RPC 2.0 error response message
 */
struct JSONRPCError {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  ErrorData error;             ///< Error data
};

/**
 * @brief Variant type that can hold any JSON-RPC 2.0 message
 */
using JSONRPCMessage = std::variant<JSONRPCRequest, JSONRPCNotification,
                                    JSONRPCResponse, JSONRPCError>;

/**
 * @brief Name and version of a protocol participant
 */
struct Implementation {
  std::string name;    ///< Implementation name
  std::string version; ///< Implementation version
};

/**
 * @brief Result of the initialize handshake
 */
struct InitializeResult {
  std::string protocolVersion;             ///< Negotiated revision
  nlohmann::json capabilities;             ///< Peer capabilities as declared
  Implementation serverInfo;               ///< Peer identity
  std::optional<std::string> instructions; ///< Usage hints from the server
};

/**
 * @brief Task status
 */
enum class TaskStatus { Working, InputRequired, Completed, Failed, Cancelled };

/**
 * @brief Wire name of a task status
 */
std::string toString(TaskStatus status);

/**
 * @brief Parse a wire task status
 *
 * @return std::nullopt for an unknown name
 */
std::optional<TaskStatus> taskStatusFromString(const std::string &status);

/**
 * @brief Whether a status admits no further transitions
 */
inline bool isTerminal(TaskStatus status) {
  return status == TaskStatus::Completed || status == TaskStatus::Failed ||
         status == TaskStatus::Cancelled;
}

/**
 * @brief Task descriptor exchanged in task results and status notifications
 */
struct TaskDescriptor {
  std::string taskId;                       ///< Task identifier
  TaskStatus status = TaskStatus::Working;  ///< Current status
  std::optional<std::string> statusMessage; ///< Human readable status
  std::optional<std::int64_t> pollInterval; ///< Suggested poll interval (ms)
  std::optional<std::int64_t> ttl;          ///< Retention after creation (ms)
  std::optional<std::string> createdAt;     ///< ISO-8601 creation time
  std::optional<std::string> lastUpdatedAt; ///< ISO-8601 last status change

  bool operator==(const TaskDescriptor &) const = default;
};

/**
 * @brief Task augmentation attached to a request as params.task
 */
struct TaskMetadata {
  std::optional<std::int64_t> ttl; ///< Requested retention (ms)
};

/**
 * @brief Page of tasks returned by tasks/list
 */
struct ListTasksResult {
  std::vector<TaskDescriptor> tasks;     ///< Tasks on this page
  std::optional<std::string> nextCursor; ///< Cursor for the next page
};

/**
 * @brief Parameters of notifications/progress
 */
struct ProgressParams {
  std::string progressToken;          ///< Token the progress belongs to
  double progress = 0;                ///< Progress so far
  std::optional<double> total;        ///< Total, when known
  std::optional<std::string> message; ///< Progress description
};

/**
 * @brief Parameters of notifications/cancelled
 */
struct CancelledParams {
  RequestId requestId;               ///< Request being cancelled
  std::optional<std::string> reason; ///< Optional reason
};

/**
 * @brief Parameters of notifications/message
 */
struct LoggingMessageParams {
  std::string level;                 ///< Syslog style level name
  std::optional<std::string> logger; ///< Logger name
  nlohmann::json data;               ///< Log payload
};

/**
 * @brief Whether a tool may be invoked as a task
 */
enum class TaskSupport { Forbidden, Optional, Required };

/**
 * @brief Tool definition as returned by tools/list
 */
struct Tool {
  std::string name;                       ///< Tool name
  std::optional<std::string> description; ///< Tool description
  nlohmann::json inputSchema;             ///< JSON Schema for the input
  std::optional<TaskSupport> taskSupport; ///< execution.taskSupport hint
};

/**
 * @brief Parameterized resource as returned by resources/templates/list
 */
struct ResourceTemplate {
  std::string uriTemplate;                ///< RFC 6570 URI template
  std::string name;                       ///< Template name
  std::optional<std::string> title;       ///< Display title
  std::optional<std::string> description; ///< Description
  std::optional<std::string> mimeType;    ///< MIME type of expanded resources
};

/**
 * @brief Suggestions returned by completion/complete
 */
struct Completion {
  std::vector<std::string> values; ///< At most 100 suggestions
  std::optional<int> total;        ///< Total number of matches
  bool hasMore = false;            ///< More matches exist than returned
};

/**
 * @brief Filesystem root exposed to servers
 */
struct Root {
  std::string uri;                 ///< file:// URI
  std::optional<std::string> name; ///< Display name
};

} // namespace types
} // namespace mcphub

// JSON serialization for the protocol types
namespace nlohmann {

template <> struct adl_serializer<mcphub::types::ErrorCode> {
  static void to_json(json &j, const mcphub::types::ErrorCode &code) {
    j = static_cast<int>(code);
  }

  static void from_json(const json &j, mcphub::types::ErrorCode &code) {
    code = static_cast<mcphub::types::ErrorCode>(j.get<int>());
  }
};

template <> struct adl_serializer<mcphub::types::ErrorData> {
  static void to_json(json &j, const mcphub::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, mcphub::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    error.data = j.contains("data") ? j["data"] : json(nullptr);
  }
};

template <> struct adl_serializer<mcphub::types::RequestId> {
  static void to_json(json &j, const mcphub::types::RequestId &id) {
    std::visit([&j](const auto &value) { j = value; }, id);
  }

  static void from_json(const json &j, mcphub::types::RequestId &id) {
    if (j.is_string()) {
      id = j.get<std::string>();
    } else {
      id = j.get<int>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::JSONRPCRequest> {
  static void to_json(json &j, const mcphub::types::JSONRPCRequest &request) {
    j = json::object();
    j["jsonrpc"] = request.jsonrpc;
    j["id"] = request.id;
    j["method"] = request.method;
    if (request.params) {
      j["params"] = *request.params;
    }
  }

  static void from_json(const json &j, mcphub::types::JSONRPCRequest &request) {
    j.at("jsonrpc").get_to(request.jsonrpc);
    j.at("id").get_to(request.id);
    j.at("method").get_to(request.method);
    if (j.contains("params")) {
      request.params = j["params"];
    }
  }
};

template <> struct adl_serializer<mcphub::types::JSONRPCResponse> {
  static void to_json(json &j, const mcphub::types::JSONRPCResponse &response) {
    j = json::object();
    j["jsonrpc"] = response.jsonrpc;
    j["id"] = response.id;
    j["result"] = response.result;
  }

  static void from_json(const json &j,
                        mcphub::types::JSONRPCResponse &response) {
    j.at("jsonrpc").get_to(response.jsonrpc);
    j.at("id").get_to(response.id);
    j.at("result").get_to(response.result);
  }
};

template <> struct adl_serializer<mcphub::types::JSONRPCError> {
  static void to_json(json &j, const mcphub::types::JSONRPCError &error) {
    j = json::object();
    j["jsonrpc"] = error.jsonrpc;
    j["id"] = error.id;
    j["error"] = error.error;
  }

  static void from_json(const json &j, mcphub::types::JSONRPCError &error) {
    j.at("jsonrpc").get_to(error.jsonrpc);
    j.at("id").get_to(error.id);
    j.at("error").get_to(error.error);
  }
};

template <> struct adl_serializer<mcphub::types::JSONRPCNotification> {
  static void to_json(json &j,
                      const mcphub::types::JSONRPCNotification &notification) {
    j = json::object();
    j["jsonrpc"] = notification.jsonrpc;
    j["method"] = notification.method;
    if (notification.params) {
      j["params"] = *notification.params;
    }
  }

  static void from_json(const json &j,
                        mcphub::types::JSONRPCNotification &notification) {
    j.at("jsonrpc").get_to(notification.jsonrpc);
    j.at("method").get_to(notification.method);
    if (j.contains("params")) {
      notification.params = j["params"];
    }
  }
};

template <> struct adl_serializer<mcphub::types::Implementation> {
  static void to_json(json &j, const mcphub::types::Implementation &impl) {
    j = json{{"name", impl.name}, {"version", impl.version}};
  }

  static void from_json(const json &j, mcphub::types::Implementation &impl) {
    j.at("name").get_to(impl.name);
    impl.version = j.value("version", "");
  }
};

template <> struct adl_serializer<mcphub::types::InitializeResult> {
  static void to_json(json &j, const mcphub::types::InitializeResult &result) {
    j = json{{"protocolVersion", result.protocolVersion},
             {"capabilities", result.capabilities},
             {"serverInfo", result.serverInfo}};
    if (result.instructions) {
      j["instructions"] = *result.instructions;
    }
  }

  static void from_json(const json &j,
                        mcphub::types::InitializeResult &result) {
    j.at("protocolVersion").get_to(result.protocolVersion);
    result.capabilities = j.value("capabilities", json::object());
    j.at("serverInfo").get_to(result.serverInfo);
    if (j.contains("instructions") && j["instructions"].is_string()) {
      result.instructions = j["instructions"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::TaskStatus> {
  static void to_json(json &j, const mcphub::types::TaskStatus &status) {
    j = mcphub::types::toString(status);
  }

  static void from_json(const json &j, mcphub::types::TaskStatus &status) {
    auto parsed = mcphub::types::taskStatusFromString(j.get<std::string>());
    if (!parsed) {
      throw std::invalid_argument("Unknown task status: " +
                                  j.get<std::string>());
    }
    status = *parsed;
  }
};

template <> struct adl_serializer<mcphub::types::TaskDescriptor> {
  static void to_json(json &j, const mcphub::types::TaskDescriptor &task) {
    j = json{{"taskId", task.taskId}, {"status", task.status}};
    if (task.statusMessage) {
      j["statusMessage"] = *task.statusMessage;
    }
    if (task.pollInterval) {
      j["pollInterval"] = *task.pollInterval;
    }
    if (task.ttl) {
      j["ttl"] = *task.ttl;
    }
    if (task.createdAt) {
      j["createdAt"] = *task.createdAt;
    }
    if (task.lastUpdatedAt) {
      j["lastUpdatedAt"] = *task.lastUpdatedAt;
    }
  }

  static void from_json(const json &j, mcphub::types::TaskDescriptor &task) {
    j.at("taskId").get_to(task.taskId);
    j.at("status").get_to(task.status);
    task.statusMessage.reset();
    task.pollInterval.reset();
    task.ttl.reset();
    task.createdAt.reset();
    task.lastUpdatedAt.reset();
    if (j.contains("statusMessage") && j["statusMessage"].is_string()) {
      task.statusMessage = j["statusMessage"].get<std::string>();
    }
    if (j.contains("pollInterval") && j["pollInterval"].is_number()) {
      task.pollInterval = j["pollInterval"].get<std::int64_t>();
    }
    if (j.contains("ttl") && j["ttl"].is_number()) {
      task.ttl = j["ttl"].get<std::int64_t>();
    }
    if (j.contains("createdAt") && j["createdAt"].is_string()) {
      task.createdAt = j["createdAt"].get<std::string>();
    }
    if (j.contains("lastUpdatedAt") && j["lastUpdatedAt"].is_string()) {
      task.lastUpdatedAt = j["lastUpdatedAt"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::TaskMetadata> {
  static void to_json(json &j, const mcphub::types::TaskMetadata &meta) {
    j = json::object();
    if (meta.ttl) {
      j["ttl"] = *meta.ttl;
    }
  }

  static void from_json(const json &j, mcphub::types::TaskMetadata &meta) {
    meta.ttl.reset();
    if (j.contains("ttl") && j["ttl"].is_number()) {
      meta.ttl = j["ttl"].get<std::int64_t>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::ListTasksResult> {
  static void to_json(json &j, const mcphub::types::ListTasksResult &page) {
    j = json{{"tasks", page.tasks}};
    if (page.nextCursor) {
      j["nextCursor"] = *page.nextCursor;
    }
  }

  static void from_json(const json &j, mcphub::types::ListTasksResult &page) {
    page.tasks = j.value("tasks", std::vector<mcphub::types::TaskDescriptor>{});
    page.nextCursor.reset();
    if (j.contains("nextCursor") && j["nextCursor"].is_string()) {
      page.nextCursor = j["nextCursor"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::ProgressParams> {
  static void to_json(json &j, const mcphub::types::ProgressParams &params) {
    j = json{{"progressToken", params.progressToken},
             {"progress", params.progress}};
    if (params.total) {
      j["total"] = *params.total;
    }
    if (params.message) {
      j["message"] = *params.message;
    }
  }

  static void from_json(const json &j, mcphub::types::ProgressParams &params) {
    // Peers may echo numeric tokens; they are tracked by their text form.
    const auto &token = j.at("progressToken");
    params.progressToken =
        token.is_string() ? token.get<std::string>() : token.dump();
    j.at("progress").get_to(params.progress);
    params.total.reset();
    params.message.reset();
    if (j.contains("total") && j["total"].is_number()) {
      params.total = j["total"].get<double>();
    }
    if (j.contains("message") && j["message"].is_string()) {
      params.message = j["message"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::CancelledParams> {
  static void to_json(json &j, const mcphub::types::CancelledParams &params) {
    j = json{{"requestId", params.requestId}};
    if (params.reason) {
      j["reason"] = *params.reason;
    }
  }

  static void from_json(const json &j,
                        mcphub::types::CancelledParams &params) {
    j.at("requestId").get_to(params.requestId);
    params.reason.reset();
    if (j.contains("reason") && j["reason"].is_string()) {
      params.reason = j["reason"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::LoggingMessageParams> {
  static void to_json(json &j,
                      const mcphub::types::LoggingMessageParams &params) {
    j = json{{"level", params.level}, {"data", params.data}};
    if (params.logger) {
      j["logger"] = *params.logger;
    }
  }

  static void from_json(const json &j,
                        mcphub::types::LoggingMessageParams &params) {
    j.at("level").get_to(params.level);
    params.data = j.value("data", json(nullptr));
    params.logger.reset();
    if (j.contains("logger") && j["logger"].is_string()) {
      params.logger = j["logger"].get<std::string>();
    }
  }
};

template <> struct adl_serializer<mcphub::types::Tool> {
  static void to_json(json &j, const mcphub::types::Tool &tool) {
    j = json{{"name", tool.name}, {"inputSchema", tool.inputSchema}};
    if (tool.description) {
      j["description"] = *tool.description;
    }
    if (tool.taskSupport) {
      static const char *names[] = {"forbidden", "optional", "required"};
      j["execution"] = {
          {"taskSupport", names[static_cast<int>(*tool.taskSupport)]}};
    }
  }

  static void from_json(const json &j, mcphub::types::Tool &tool) {
    j.at("name").get_to(tool.name);
    tool.inputSchema = j.value("inputSchema", json::object());
    tool.description.reset();
    tool.taskSupport.reset();
    if (j.contains("description") && j["description"].is_string()) {
      tool.description = j["description"].get<std::string>();
    }
    if (j.contains("execution") && j["execution"].is_object()) {
      const std::string support = j["execution"].value("taskSupport", "");
      if (support == "forbidden") {
        tool.taskSupport = mcphub::types::TaskSupport::Forbidden;
      } else if (support == "optional") {
        tool.taskSupport = mcphub::types::TaskSupport::Optional;
      } else if (support == "required") {
        tool.taskSupport = mcphub::types::TaskSupport::Required;
      }
    }
  }
};

template <> struct adl_serializer<mcphub::types::ResourceTemplate> {
  static void to_json(json &j, const mcphub::types::ResourceTemplate &rt) {
    j = json{{"uriTemplate", rt.uriTemplate}, {"name", rt.name}};
    if (rt.title) {
      j["title"] = *rt.title;
    }
    if (rt.description) {
      j["description"] = *rt.description;
    }
    if (rt.mimeType) {
      j["mimeType"] = *rt.mimeType;
    }
  }

  static void from_json(const json &j, mcphub::types::ResourceTemplate &rt) {
    j.at("uriTemplate").get_to(rt.uriTemplate);
    j.at("name").get_to(rt.name);
    auto optional = [&j](const char *key) -> std::optional<std::string> {
      if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
      }
      return std::nullopt;
    };
    rt.title = optional("title");
    rt.description = optional("description");
    rt.mimeType = optional("mimeType");
  }
};

template <> struct adl_serializer<mcphub::types::Completion> {
  static void to_json(json &j, const mcphub::types::Completion &completion) {
    j = json{{"values", completion.values}, {"hasMore", completion.hasMore}};
    if (completion.total) {
      j["total"] = *completion.total;
    }
  }

  static void from_json(const json &j, mcphub::types::Completion &completion) {
    j.at("values").get_to(completion.values);
    completion.total.reset();
    if (j.contains("total") && j["total"].is_number_integer()) {
      completion.total = j["total"].get<int>();
    }
    completion.hasMore = j.value("hasMore", false);
  }
};

template <> struct adl_serializer<mcphub::types::Root> {
  static void to_json(json &j, const mcphub::types::Root &root) {
    j = json{{"uri", root.uri}};
    if (root.name) {
      j["name"] = *root.name;
    }
  }

  static void from_json(const json &j, mcphub::types::Root &root) {
    j.at("uri").get_to(root.uri);
    root.name.reset();
    if (j.contains("name") && j["name"].is_string()) {
      root.name = j["name"].get<std::string>();
    }
  }
};

} // namespace nlohmann

#endif // MCPHUB_TYPES_HPP_
