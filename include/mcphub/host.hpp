#ifndef MCPHUB_HOST_HPP_
#define MCPHUB_HOST_HPP_

#include "mcphub/types.hpp"
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcphub {

/**
 * @brief The user's answer to a form elicitation
 */
struct ElicitationResponse {
  enum class Action { Accept, Decline, Cancel };

  Action action = Action::Decline;
  nlohmann::json content; ///< Form values when accepted
};

std::string toString(ElicitationResponse::Action action);

/**
 * @brief The user's decision on a sampling request
 */
struct SamplingResponse {
  bool approved = false;
  nlohmann::json result; ///< CreateMessageResult when approved
};

/**
 * @brief Application side of the hub
 *
 * Renders approval and form UI and runs model calls; the hub only forwards
 * requests and waits on the returned futures.
 */
class Host {
public:
  virtual ~Host() = default;

  /**
   * @brief Roots exposed to servers
   */
  virtual std::vector<types::Root> roots() = 0;

  /**
   * @brief Ask the user to fill in a form
   *
   * @param server Name of the requesting server
   * @param params Params of the elicitation/create request
   */
  virtual std::future<ElicitationResponse>
  elicit(const std::string &server, const nlohmann::json &params) = 0;

  /**
   * @brief Ask the user to approve a sampling request and run it
   *
   * @param server Name of the requesting server
   * @param params Params of the sampling/createMessage request
   */
  virtual std::future<SamplingResponse>
  sample(const std::string &server, const nlohmann::json &params) = 0;
};

/**
 * @brief Optional reference to the host
 *
 * The host may go away before the hub does; current() then returns nullptr
 * and callers treat that as a normal outcome.
 */
class HostLink {
public:
  void attach(const std::shared_ptr<Host> &host);
  void detach();
  std::shared_ptr<Host> current() const;

private:
  mutable std::mutex mutex_;
  std::weak_ptr<Host> host_;
};

} // namespace mcphub

#endif // MCPHUB_HOST_HPP_
