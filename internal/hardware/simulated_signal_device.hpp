#pragma once

#include <atomic>
#include <cstdint>

#include "internal/hardware/signal_device.hpp"

namespace linecheck::hardware {

// Logs every call and counts them; no physical outputs.
class SimulatedSignalDevice final : public SignalDevice {
 public:
  void SignalPass() override;
  void SignalFail() override;
  void HaltLine() override;
  void ResumeLine() override;

  bool Enabled() const override {
    return true;
  }

  bool Halted() const {
    return halted_.load();
  }
  uint64_t PassSignals() const {
    return pass_signals_.load();
  }
  uint64_t FailSignals() const {
    return fail_signals_.load();
  }

 private:
  std::atomic<bool>     halted_{false};
  std::atomic<uint64_t> pass_signals_{0};
  std::atomic<uint64_t> fail_signals_{0};
};

class DisabledSignalDevice final : public SignalDevice {
 public:
  void SignalPass() override {
  }
  void SignalFail() override {
  }
  void HaltLine() override {
  }
  void ResumeLine() override {
  }
  bool Enabled() const override {
    return false;
  }
};

} // namespace linecheck::hardware
