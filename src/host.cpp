#include "mcphub/host.hpp"

namespace mcphub {

std::string toString(ElicitationResponse::Action action) {
  switch (action) {
  case ElicitationResponse::Action::Accept:
    return "accept";
  case ElicitationResponse::Action::Decline:
    return "decline";
  case ElicitationResponse::Action::Cancel:
    return "cancel";
  }
  return "decline";
}

void HostLink::attach(const std::shared_ptr<Host> &host) {
  std::lock_guard<std::mutex> lock(mutex_);
  host_ = host;
}

void HostLink::detach() {
  std::lock_guard<std::mutex> lock(mutex_);
  host_.reset();
}

std::shared_ptr<Host> HostLink::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return host_.lock();
}

} // namespace mcphub
