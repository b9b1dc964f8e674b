#include "client/cpp/reconnect_backoff.h"

#include <algorithm>

namespace linecheck::client {

ReconnectBackoff::ReconnectBackoff(std::chrono::seconds initial, std::chrono::seconds max)
    : initial_(initial.count() > 0 ? initial : std::chrono::seconds(1)), max_(std::max(max, initial_)), current_(initial_) {
}

std::chrono::seconds ReconnectBackoff::Next() {
  const auto delay = current_;
  current_         = std::min(current_ * 2, max_);
  return delay;
}

void ReconnectBackoff::Reset() {
  current_ = initial_;
}

} // namespace linecheck::client
