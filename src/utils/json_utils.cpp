#include "mcphub/utils/json_utils.hpp"

#include <ctime>
#include <iomanip>
#include <nlohmann/json-schema.hpp>
#include <sstream>

namespace mcphub {
namespace json_utils {

bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg) {
  try {
    nlohmann::json_schema::json_validator validator;
    validator.set_root_schema(schema);
    validator.validate(json);
    return true;
  } catch (const std::exception &e) {
    if (error_msg) {
      *error_msg = e.what();
    }
    return false;
  }
}

void validateOrThrow(const nlohmann::json &json, const nlohmann::json &schema,
                     const std::string &what) {
  std::string error;
  if (!validate(json, schema, &error)) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "Invalid " + what + ": " + error);
  }
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw TransportException("JSON parse error: " + std::string(e.what()));
  }
}

MessageType getMessageType(const nlohmann::json &json) {
  if (!json.is_object() || !json.contains("jsonrpc") ||
      json["jsonrpc"] != "2.0") {
    throw ProtocolException(
        "Invalid JSON-RPC message: missing or invalid jsonrpc version");
  }

  if (json.contains("error") && json.contains("id")) {
    return MessageType::Error;
  }

  if (json.contains("result") && json.contains("id")) {
    return MessageType::Response;
  }

  if (json.contains("method")) {
    if (json.contains("id")) {
      return MessageType::Request;
    } else {
      return MessageType::Notification;
    }
  }

  throw ProtocolException(
      "Invalid JSON-RPC message: cannot determine message type");
}

types::JSONRPCMessage parseMessage(const std::string &json_str) {
  nlohmann::json json = parse(json_str);

  try {
    switch (getMessageType(json)) {
    case MessageType::Request:
      return json.get<types::JSONRPCRequest>();
    case MessageType::Notification:
      return json.get<types::JSONRPCNotification>();
    case MessageType::Response:
      return json.get<types::JSONRPCResponse>();
    case MessageType::Error:
      return json.get<types::JSONRPCError>();
    }
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolException("JSON-RPC message parse error: " +
                            std::string(e.what()));
  }
  throw ProtocolException("Unknown message type");
}

std::string serializeMessage(const types::JSONRPCMessage &message) {
  return std::visit([](const auto &msg) { return nlohmann::json(msg).dump(); },
                    message);
}

std::string toIso8601(std::chrono::system_clock::time_point time) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          time.time_since_epoch()) %
                      1000;
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
     << std::setw(3) << millis.count() << 'Z';
  return ss.str();
}

namespace schemas {

const nlohmann::json &progressParams() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"progressToken", "progress"}},
      {"properties",
       {{"progressToken", {{"type", {"string", "integer"}}}},
        {"progress", {{"type", "number"}}},
        {"total", {{"type", "number"}}},
        {"message", {{"type", "string"}}}}}};
  return schema;
}

const nlohmann::json &cancelledParams() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"requestId"}},
      {"properties",
       {{"requestId", {{"type", {"string", "integer"}}}},
        {"reason", {{"type", "string"}}}}}};
  return schema;
}

const nlohmann::json &taskDescriptor() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"taskId", "status"}},
      {"properties",
       {{"taskId", {{"type", "string"}, {"minLength", 1}}},
        {"status",
         {{"enum",
           {"working", "input_required", "completed", "failed",
            "cancelled"}}}},
        {"statusMessage", {{"type", "string"}}},
        {"pollInterval", {{"type", "integer"}, {"minimum", 0}}},
        {"ttl", {{"type", {"integer", "null"}}, {"minimum", 0}}},
        {"createdAt", {{"type", "string"}}},
        {"lastUpdatedAt", {{"type", "string"}}}}}};
  return schema;
}

const nlohmann::json &createTaskResult() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"task"}},
      {"properties", {{"task", taskDescriptor()}}}};
  return schema;
}

const nlohmann::json &listTasksResult() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"tasks"}},
      {"properties",
       {{"tasks", {{"type", "array"}, {"items", taskDescriptor()}}},
        {"nextCursor", {{"type", "string"}}}}}};
  return schema;
}

const nlohmann::json &initializeResult() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"protocolVersion", "capabilities", "serverInfo"}},
      {"properties",
       {{"protocolVersion", {{"type", "string"}}},
        {"capabilities", {{"type", "object"}}},
        {"serverInfo",
         {{"type", "object"},
          {"required", {"name"}},
          {"properties",
           {{"name", {{"type", "string"}}},
            {"version", {{"type", "string"}}}}}}},
        {"instructions", {{"type", "string"}}}}}};
  return schema;
}

const nlohmann::json &completeResult() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"completion"}},
      {"properties",
       {{"completion",
         {{"type", "object"},
          {"required", {"values"}},
          {"properties",
           {{"values",
             {{"type", "array"},
              {"maxItems", 100},
              {"items", {{"type", "string"}}}}},
            {"total", {{"type", "integer"}, {"minimum", 0}}},
            {"hasMore", {{"type", "boolean"}}}}}}}}}};
  return schema;
}

const nlohmann::json &listResourceTemplatesResult() {
  static const nlohmann::json schema = {
      {"type", "object"},
      {"required", {"resourceTemplates"}},
      {"properties",
       {{"resourceTemplates",
         {{"type", "array"},
          {"items",
           {{"type", "object"},
            {"required", {"uriTemplate", "name"}},
            {"properties",
             {{"uriTemplate", {{"type", "string"}}},
              {"name", {{"type", "string"}}}}}}}}},
        {"nextCursor", {{"type", "string"}}}}}};
  return schema;
}

} // namespace schemas

} // namespace json_utils
} // namespace mcphub
