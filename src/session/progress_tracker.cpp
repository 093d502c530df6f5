#include "mcphub/session/progress_tracker.hpp"
#include "mcphub/utils/ids.hpp"
#include "mcphub/utils/logging.hpp"

#include <sstream>

namespace mcphub {
namespace session {

ProgressTracker::ProgressTracker(std::string label) : label_(std::move(label)) {}

std::string ProgressTracker::issueToken(ProgressOwner owner,
                                        ProgressObserver observer) {
  std::string token = ids::newProgressToken();
  std::lock_guard<std::mutex> lock(mutex_);
  Entry entry;
  entry.state.owner = std::move(owner);
  entry.observer = std::move(observer);
  tokens_.emplace(token, std::move(entry));
  return token;
}

bool ProgressTracker::rebind(const std::string &token, ProgressOwner owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return false;
  }
  it->second.state.owner = std::move(owner);
  return true;
}

bool ProgressTracker::release(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.erase(token) > 0;
}

bool ProgressTracker::onProgressEvent(const types::ProgressParams &params) {
  ProgressObserver observer;
  double previous = 0;
  bool warn = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(params.progressToken);
    if (it == tokens_.end()) {
      MCPHUB_LOG_DEBUG("[" + label_ + "] Progress for unknown token " +
                       params.progressToken);
      return false;
    }
    auto &state = it->second.state;
    previous = state.progress;
    if (params.progress < previous && !it->second.regression_logged) {
      it->second.regression_logged = true;
      warn = true;
    }
    state.progress = params.progress;
    state.total = params.total;
    state.message = params.message;
    ++state.updates;
    observer = it->second.observer;
  }

  // Regressions are still delivered
  if (warn) {
    std::ostringstream ss;
    ss << "[" << label_ << "] Non-monotonic progress for token "
       << params.progressToken << ": " << params.progress << " < "
       << previous;
    MCPHUB_LOG_WARNING(ss.str());
  }

  if (observer) {
    try {
      observer(params.progress, params.total, params.message);
    } catch (const std::exception &e) {
      MCPHUB_LOG_WARNING("[" + label_ + "] Progress observer failed: " +
                         e.what());
    }
  }
  return true;
}

std::optional<ProgressSnapshot>
ProgressTracker::snapshot(const std::string &token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

std::size_t ProgressTracker::releaseAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = tokens_.size();
  tokens_.clear();
  return count;
}

std::size_t ProgressTracker::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

} // namespace session
} // namespace mcphub
