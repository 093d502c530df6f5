#ifndef MCPHUB_UTILS_IDS_HPP_
#define MCPHUB_UTILS_IDS_HPP_

#include <string>

namespace mcphub {
namespace ids {

/**
 * @brief Generate a request id
 *
 * Combines a timestamp, a process-wide counter and a random component, so an
 * id is never handed out twice while the process runs.
 */
std::string newRequestId();

/**
 * @brief Generate a progress token, unique for the process lifetime
 */
std::string newProgressToken();

/**
 * @brief Generate a 128-bit task id from the OS entropy source
 *
 * @return std::string 32 lowercase hex digits
 */
std::string newTaskId();

} // namespace ids
} // namespace mcphub

#endif // MCPHUB_UTILS_IDS_HPP_
