#pragma once

#include <chrono>

namespace linecheck::client {

/*
  Exponential reconnect delay: initial, doubling up to max.
  Reset() after a successful reconnect starts over at initial.
*/
class ReconnectBackoff {
 public:
  explicit ReconnectBackoff(std::chrono::seconds initial = std::chrono::seconds(1), std::chrono::seconds max = std::chrono::seconds(30));

  // Delay to wait before the next attempt; advances the sequence.
  std::chrono::seconds Next();

  void Reset();

  std::chrono::seconds Current() const {
    return current_;
  }

 private:
  std::chrono::seconds initial_;
  std::chrono::seconds max_;
  std::chrono::seconds current_;
};

} // namespace linecheck::client
