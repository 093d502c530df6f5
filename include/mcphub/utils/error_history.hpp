#ifndef MCPHUB_UTILS_ERROR_HISTORY_HPP_
#define MCPHUB_UTILS_ERROR_HISTORY_HPP_

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {
namespace utils {

/**
 * @brief Severity of an error history entry
 */
enum class ErrorLevel { Info, Warn, Error };

std::string toString(ErrorLevel level);

/**
 * @brief One recorded problem of a connection
 */
struct ErrorEntry {
  std::string message;                             ///< Possibly truncated
  std::chrono::system_clock::time_point timestamp; ///< When it was recorded
  ErrorLevel level = ErrorLevel::Error;            ///< Severity
};

/**
 * @brief Bounded, oldest-first record of connection errors
 */
class ErrorHistory {
public:
  static constexpr std::size_t kDefaultCapacity = 100;
  static constexpr std::size_t kMaxMessageLength = 1000;
  static constexpr const char *kTruncationSuffix =
      "...(error message truncated)";

  explicit ErrorHistory(std::size_t capacity = kDefaultCapacity);

  /**
   * @brief Record a message, truncating it and evicting the oldest entry
   * when full
   */
  void append(const std::string &message, ErrorLevel level = ErrorLevel::Error);

  const std::deque<ErrorEntry> &entries() const { return entries_; }
  std::optional<ErrorEntry> last() const;
  std::size_t size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

private:
  std::size_t capacity_;
  std::deque<ErrorEntry> entries_;
};

} // namespace utils
} // namespace mcphub

#endif // MCPHUB_UTILS_ERROR_HISTORY_HPP_
