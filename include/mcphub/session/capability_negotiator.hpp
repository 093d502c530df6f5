#ifndef MCPHUB_SESSION_CAPABILITY_NEGOTIATOR_HPP_
#define MCPHUB_SESSION_CAPABILITY_NEGOTIATOR_HPP_

#include "mcphub/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
namespace session {

/**
 * @brief Which client features the hub advertises
 */
struct LocalCapabilityOptions {
  bool roots = true;       ///< roots/list with list_changed notifications
  bool sampling = true;    ///< sampling/createMessage
  bool elicitation = true; ///< elicitation/create (form mode)
  bool tasks = true;       ///< task-augmented sampling and elicitation
};

/**
 * @brief Optional server features that operations may depend on
 */
enum class Feature {
  Tools,
  Resources,
  ResourceSubscriptions,
  Prompts,
  Logging,
  Completions,
  Tasks,
  TaskList,
  TaskCancel
};

std::string toString(Feature feature);

/**
 * @brief Computes the advertised capability set and records the peer's
 *
 * The peer set is read-only once negotiate() succeeded; reset() clears it for
 * a new session.
 */
class CapabilityNegotiator {
public:
  explicit CapabilityNegotiator(types::Implementation client_info,
                                LocalCapabilityOptions options = {});

  /**
   * @brief Capabilities object sent in the initialize request
   */
  nlohmann::json localCapabilities() const;

  /**
   * @brief Full params of the initialize request
   */
  nlohmann::json buildInitializeParams() const;

  /**
   * @brief Validate and record the peer's initialize result
   *
   * @param result The raw result of the initialize request
   * @return types::InitializeResult The typed result
   * @throws ProtocolException if the result is malformed or the protocol
   * revision is not supported
   */
  types::InitializeResult negotiate(const nlohmann::json &result);

  bool isNegotiated() const;

  /**
   * @brief The peer's initialize result, if negotiated
   */
  std::optional<types::InitializeResult> peer() const;

  /**
   * @brief Whether the peer declared a feature
   */
  bool supports(Feature feature) const;

  /**
   * @brief Throw CapabilityException unless the peer declared a feature
   *
   * @param feature The required feature
   * @param operation Name used in the error message
   */
  void require(Feature feature, const std::string &operation) const;

  /**
   * @brief Whether a request may be sent with task augmentation
   *
   * Requires the peer's tasks capability. When the peer lists the requests it
   * accepts as tasks, the method must be among them. For tools/call a tool
   * whose cached hint is "forbidden" is excluded.
   *
   * @param method The request method
   * @param tool_name Tool name for tools/call, empty otherwise
   */
  bool supportsTaskAugmentation(const std::string &method,
                                const std::string &tool_name = "") const;

  /**
   * @brief Whether the local side accepts the peer's request as a task
   */
  bool acceptsTaskRequest(const std::string &method) const;

  /**
   * @brief Cache the task support hints of a tools/list page
   */
  void recordTools(const std::vector<types::Tool> &tools);

  /**
   * @brief Drop cached tool hints, after a tools list_changed signal
   */
  void forgetTools();

  /**
   * @brief Cached hint for a tool, std::nullopt when unknown or undeclared
   */
  std::optional<types::TaskSupport>
  toolTaskSupport(const std::string &tool_name) const;

  void reset();

  static const std::vector<std::string> &supportedProtocolVersions();

private:
  const nlohmann::json *peerCapability(const std::string &path) const;

  types::Implementation client_info_;
  LocalCapabilityOptions options_;

  mutable std::mutex mutex_;
  std::optional<types::InitializeResult> peer_;
  std::map<std::string, std::optional<types::TaskSupport>> tool_hints_;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_CAPABILITY_NEGOTIATOR_HPP_
