#include "mcphub/utils/ids.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace mcphub {
namespace ids {

namespace {
std::atomic<std::uint64_t> g_request_counter{0};
std::atomic<std::uint64_t> g_token_counter{0};

std::uint64_t randomWord() {
  static std::mutex mutex;
  static std::mt19937_64 rng(std::random_device{}());
  std::lock_guard<std::mutex> lock(mutex);
  return rng();
}
} // namespace

std::string newRequestId() {
  std::uint64_t counter = g_request_counter++;
  std::uint64_t timestamp =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();

  std::stringstream ss;
  ss << std::hex << timestamp << "-" << counter << "-" << (randomWord() % 10000);
  return ss.str();
}

std::string newProgressToken() {
  std::stringstream ss;
  ss << "pt-" << std::hex << g_token_counter++ << "-" << std::setw(16)
     << std::setfill('0') << randomWord();
  return ss.str();
}

std::string newTaskId() {
  // random_device is not guaranteed to be thread safe; one per call is.
  std::random_device device;
  std::uniform_int_distribution<std::uint32_t> dist;

  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (int i = 0; i < 4; ++i) {
    ss << std::setw(8) << dist(device);
  }
  return ss.str();
}

} // namespace ids
} // namespace mcphub
