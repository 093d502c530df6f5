#ifndef MCPHUB_UTILS_JSON_UTILS_HPP_
#define MCPHUB_UTILS_JSON_UTILS_HPP_

#include "mcphub/types.hpp"
#include "mcphub/utils/error.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

namespace mcphub {
namespace json_utils {

/**
 * @brief Validate JSON against a JSON schema
 *
 * @param json The JSON to validate
 * @param schema The JSON schema
 * @param error_msg Optional output for the validation error message
 * @return true if valid, false otherwise
 */
bool validate(const nlohmann::json &json, const nlohmann::json &schema,
              std::string *error_msg = nullptr);

/**
 * @brief Validate JSON against a schema and throw on mismatch
 *
 * @param json The JSON to validate
 * @param schema The JSON schema
 * @param what Name of the payload, used in the error message
 * @throws ProtocolException if the JSON does not match
 */
void validateOrThrow(const nlohmann::json &json, const nlohmann::json &schema,
                     const std::string &what);

/**
 * @brief Validate a peer payload and convert it to a typed value
 *
 * @throws ProtocolException if validation or conversion fails
 */
template <typename T>
T decode(const nlohmann::json &json, const nlohmann::json &schema,
         const std::string &what) {
  validateOrThrow(json, schema, what);
  try {
    return json.get<T>();
  } catch (const std::exception &e) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "Malformed " + what + ": " + e.what());
  }
}

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string
 * @return nlohmann::json The parsed JSON
 * @throws TransportException if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief Parse a JSON-RPC message from a string
 *
 * @throws TransportException if parsing fails
 * @throws ProtocolException if the message is not valid JSON-RPC 2.0
 */
types::JSONRPCMessage parseMessage(const std::string &json_str);

/**
 * @brief Determine the type of a JSON-RPC message
 */
enum class MessageType { Request, Notification, Response, Error };

/**
 * @brief Get the type of a JSON-RPC message
 *
 * @throws ProtocolException if the message is not a valid JSON-RPC message
 */
MessageType getMessageType(const nlohmann::json &json);

/**
 * @brief Serialize a JSON-RPC message to a string
 */
std::string serializeMessage(const types::JSONRPCMessage &message);

/**
 * @brief Format a point in time as ISO-8601 UTC with millisecond precision
 */
std::string toIso8601(std::chrono::system_clock::time_point time);

/**
 * @brief Schemas for payloads the hub accepts from peers
 */
namespace schemas {
const nlohmann::json &progressParams();
const nlohmann::json &cancelledParams();
const nlohmann::json &taskDescriptor();
const nlohmann::json &createTaskResult();
const nlohmann::json &listTasksResult();
const nlohmann::json &initializeResult();
const nlohmann::json &completeResult();
const nlohmann::json &listResourceTemplatesResult();
} // namespace schemas

} // namespace json_utils
} // namespace mcphub

#endif // MCPHUB_UTILS_JSON_UTILS_HPP_
