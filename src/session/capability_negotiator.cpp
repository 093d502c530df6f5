#include "mcphub/session/capability_negotiator.hpp"
#include "mcphub/methods.hpp"
#include "mcphub/utils/error.hpp"
#include "mcphub/utils/json_utils.hpp"
#include "mcphub/utils/logging.hpp"

#include <algorithm>

namespace mcphub {
namespace session {

std::string toString(Feature feature) {
  switch (feature) {
  case Feature::Tools:
    return "tools";
  case Feature::Resources:
    return "resources";
  case Feature::ResourceSubscriptions:
    return "resources.subscribe";
  case Feature::Prompts:
    return "prompts";
  case Feature::Logging:
    return "logging";
  case Feature::Completions:
    return "completions";
  case Feature::Tasks:
    return "tasks";
  case Feature::TaskList:
    return "tasks.list";
  case Feature::TaskCancel:
    return "tasks.cancel";
  }
  return "unknown";
}

CapabilityNegotiator::CapabilityNegotiator(types::Implementation client_info,
                                           LocalCapabilityOptions options)
    : client_info_(std::move(client_info)), options_(options) {}

const std::vector<std::string> &
CapabilityNegotiator::supportedProtocolVersions() {
  static const std::vector<std::string> versions = {
      kProtocolVersion, "2025-06-18", "2025-03-26", "2024-11-05"};
  return versions;
}

nlohmann::json CapabilityNegotiator::localCapabilities() const {
  nlohmann::json caps = nlohmann::json::object();
  if (options_.roots) {
    caps["roots"] = {{"listChanged", true}};
  }
  if (options_.sampling) {
    caps["sampling"] = {{"tools", nlohmann::json::object()}};
  }
  if (options_.elicitation) {
    caps["elicitation"] = {{"form", nlohmann::json::object()}};
  }
  if (options_.tasks && (options_.sampling || options_.elicitation)) {
    nlohmann::json requests = nlohmann::json::object();
    if (options_.sampling) {
      requests["sampling"] = {{"createMessage", nlohmann::json::object()}};
    }
    if (options_.elicitation) {
      requests["elicitation"] = {{"create", nlohmann::json::object()}};
    }
    caps["tasks"] = {{"list", nlohmann::json::object()},
                     {"cancel", nlohmann::json::object()},
                     {"requests", requests}};
  }
  return caps;
}

nlohmann::json CapabilityNegotiator::buildInitializeParams() const {
  return {{"protocolVersion", kProtocolVersion},
          {"capabilities", localCapabilities()},
          {"clientInfo", client_info_}};
}

types::InitializeResult
CapabilityNegotiator::negotiate(const nlohmann::json &result) {
  auto parsed = json_utils::decode<types::InitializeResult>(
      result, json_utils::schemas::initializeResult(), "initialize result");

  const auto &versions = supportedProtocolVersions();
  if (std::find(versions.begin(), versions.end(), parsed.protocolVersion) ==
      versions.end()) {
    throw ProtocolException("Unsupported protocol version: " +
                                parsed.protocolVersion,
                            {{"supported", versions}});
  }
  if (parsed.protocolVersion != kProtocolVersion) {
    MCPHUB_LOG_INFO("Server " + parsed.serverInfo.name +
                    " negotiated older protocol revision " +
                    parsed.protocolVersion);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  peer_ = parsed;
  tool_hints_.clear();
  return parsed;
}

bool CapabilityNegotiator::isNegotiated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_.has_value();
}

std::optional<types::InitializeResult> CapabilityNegotiator::peer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_;
}

const nlohmann::json *
CapabilityNegotiator::peerCapability(const std::string &path) const {
  if (!peer_) {
    return nullptr;
  }
  nlohmann::json::json_pointer pointer(path);
  if (!peer_->capabilities.contains(pointer)) {
    return nullptr;
  }
  const auto &value = peer_->capabilities.at(pointer);
  if (value.is_null() || (value.is_boolean() && !value.get<bool>())) {
    return nullptr;
  }
  return &value;
}

bool CapabilityNegotiator::supports(Feature feature) const {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (feature) {
  case Feature::Tools:
    return peerCapability("/tools") != nullptr;
  case Feature::Resources:
    return peerCapability("/resources") != nullptr;
  case Feature::ResourceSubscriptions:
    return peerCapability("/resources/subscribe") != nullptr;
  case Feature::Prompts:
    return peerCapability("/prompts") != nullptr;
  case Feature::Logging:
    return peerCapability("/logging") != nullptr;
  case Feature::Completions:
    return peerCapability("/completions") != nullptr;
  case Feature::Tasks:
    return peerCapability("/tasks") != nullptr;
  case Feature::TaskList:
    return peerCapability("/tasks/list") != nullptr;
  case Feature::TaskCancel:
    return peerCapability("/tasks/cancel") != nullptr;
  }
  return false;
}

void CapabilityNegotiator::require(Feature feature,
                                   const std::string &operation) const {
  if (!supports(feature)) {
    throw CapabilityException("Server does not support " + toString(feature) +
                                  " (required by " + operation + ")",
                              {{"capability", toString(feature)}});
  }
}

bool CapabilityNegotiator::supportsTaskAugmentation(
    const std::string &method, const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto *tasks = peerCapability("/tasks");
  if (!tasks || !tasks->is_object()) {
    return false;
  }
  // Method names are slash separated, which lines up with pointer segments.
  if (tasks->contains("requests") &&
      !peerCapability("/tasks/requests/" + method)) {
    return false;
  }
  if (method == methods::CallTool && !tool_name.empty()) {
    auto it = tool_hints_.find(tool_name);
    if (it != tool_hints_.end() && it->second &&
        *it->second == types::TaskSupport::Forbidden) {
      return false;
    }
  }
  return true;
}

bool CapabilityNegotiator::acceptsTaskRequest(const std::string &method) const {
  if (!options_.tasks) {
    return false;
  }
  if (method == methods::CreateMessage) {
    return options_.sampling;
  }
  if (method == methods::Elicit) {
    return options_.elicitation;
  }
  return false;
}

void CapabilityNegotiator::recordTools(const std::vector<types::Tool> &tools) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &tool : tools) {
    tool_hints_[tool.name] = tool.taskSupport;
  }
}

void CapabilityNegotiator::forgetTools() {
  std::lock_guard<std::mutex> lock(mutex_);
  tool_hints_.clear();
}

std::optional<types::TaskSupport>
CapabilityNegotiator::toolTaskSupport(const std::string &tool_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tool_hints_.find(tool_name);
  if (it == tool_hints_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void CapabilityNegotiator::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  peer_.reset();
  tool_hints_.clear();
}

} // namespace session
} // namespace mcphub
