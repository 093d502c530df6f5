#include "mcphub/utils/error_history.hpp"

namespace mcphub {
namespace utils {

std::string toString(ErrorLevel level) {
  switch (level) {
  case ErrorLevel::Info:
    return "info";
  case ErrorLevel::Warn:
    return "warn";
  case ErrorLevel::Error:
    return "error";
  }
  return "error";
}

ErrorHistory::ErrorHistory(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ErrorHistory::append(const std::string &message, ErrorLevel level) {
  std::string text = message;
  if (text.size() > kMaxMessageLength) {
    text = text.substr(0, kMaxMessageLength) + kTruncationSuffix;
  }
  entries_.push_back({std::move(text), std::chrono::system_clock::now(), level});
  while (entries_.size() > capacity_) {
    entries_.pop_front();
  }
}

std::optional<ErrorEntry> ErrorHistory::last() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.back();
}

} // namespace utils
} // namespace mcphub
