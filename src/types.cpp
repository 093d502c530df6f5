#include "mcphub/types.hpp"

namespace mcphub {
namespace types {

std::string toString(TaskStatus status) {
  switch (status) {
  case TaskStatus::Working:
    return "working";
  case TaskStatus::InputRequired:
    return "input_required";
  case TaskStatus::Completed:
    return "completed";
  case TaskStatus::Failed:
    return "failed";
  case TaskStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::optional<TaskStatus> taskStatusFromString(const std::string &status) {
  if (status == "working") {
    return TaskStatus::Working;
  } else if (status == "input_required") {
    return TaskStatus::InputRequired;
  } else if (status == "completed") {
    return TaskStatus::Completed;
  } else if (status == "failed") {
    return TaskStatus::Failed;
  } else if (status == "cancelled") {
    return TaskStatus::Cancelled;
  }
  return std::nullopt;
}

} // namespace types
} // namespace mcphub
