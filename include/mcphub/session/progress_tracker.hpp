#ifndef MCPHUB_SESSION_PROGRESS_TRACKER_HPP_
#define MCPHUB_SESSION_PROGRESS_TRACKER_HPP_

#include "mcphub/types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcphub {
namespace session {

/**
 * @brief What a progress token belongs to
 */
struct ProgressOwner {
  enum class Kind { Request, Task };

  Kind kind = Kind::Request; ///< Owner type
  std::string id;            ///< Request id or task id

  bool operator==(const ProgressOwner &) const = default;
};

/**
 * @brief Observer for progress updates
 *
 * Receives the raw values of each event, including regressions.
 */
using ProgressObserver =
    std::function<void(double progress, std::optional<double> total,
                       const std::optional<std::string> &message)>;

/**
 * @brief Last known state of a token
 */
struct ProgressSnapshot {
  ProgressOwner owner;
  double progress = 0;
  std::optional<double> total;
  std::optional<std::string> message;
  std::size_t updates = 0;
};

/**
 * @brief Issues progress tokens and records the progress reported for them
 */
class ProgressTracker {
public:
  explicit ProgressTracker(std::string label);

  /**
   * @brief Issue a token for a request or task
   *
   * @param owner The owning request or task
   * @param observer Optional observer for updates
   * @return std::string A token unique for the process lifetime
   */
  std::string issueToken(ProgressOwner owner,
                         ProgressObserver observer = nullptr);

  /**
   * @brief Move a token to a new owner, e.g. from a request to its task
   *
   * @return false if the token is unknown
   */
  bool rebind(const std::string &token, ProgressOwner owner);

  /**
   * @brief Release a token, idempotent
   *
   * @return true if the token was live
   */
  bool release(const std::string &token);

  /**
   * @brief Apply a notifications/progress event
   *
   * Unknown tokens are ignored. A value lower than the previous one is logged
   * as a warning and still recorded and forwarded.
   *
   * @return false if the token is unknown
   */
  bool onProgressEvent(const types::ProgressParams &params);

  std::optional<ProgressSnapshot> snapshot(const std::string &token) const;

  /**
   * @brief Release every token, on connection teardown
   *
   * @return std::size_t Number of tokens released
   */
  std::size_t releaseAll();

  std::size_t size() const;

private:
  struct Entry {
    ProgressSnapshot state;
    ProgressObserver observer;
    bool regression_logged = false; ///< Regressions warn once per token
  };

  std::string label_;
  mutable std::mutex mutex_;
  std::map<std::string, Entry> tokens_;
};

} // namespace session
} // namespace mcphub

#endif // MCPHUB_SESSION_PROGRESS_TRACKER_HPP_
