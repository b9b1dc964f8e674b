#include "internal/hardware/simulated_signal_device.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace linecheck::hardware {

const char* ToString(Signal signal) {
  switch (signal) {
    case Signal::kPass:
      return "pass";
    case Signal::kFail:
      return "fail";
    case Signal::kHalt:
      return "halt";
    case Signal::kResume:
      return "resume";
  }
  return "unknown";
}

void InvokeSignal(SignalDevice& device, Signal signal) {
  try {
    switch (signal) {
      case Signal::kPass:
        device.SignalPass();
        break;
      case Signal::kFail:
        device.SignalFail();
        break;
      case Signal::kHalt:
        device.HaltLine();
        break;
      case Signal::kResume:
        device.ResumeLine();
        break;
    }
  } catch (const std::exception& ex) {
    LINECHECK_LOG_ERROR("hardware signal failed", {observability::StringField("signal", ToString(signal)), observability::StringField("error", ex.what())});
  }
}

std::shared_ptr<SignalDevice> MakeSignalDevice(const std::string& mode) {
  if (mode.empty() || mode == "simulated") {
    return std::make_shared<SimulatedSignalDevice>();
  }
  if (mode == "disabled") {
    return std::make_shared<DisabledSignalDevice>();
  }
  throw std::invalid_argument("unknown hardware mode: " + mode);
}

void SimulatedSignalDevice::SignalPass() {
  ++pass_signals_;
  LINECHECK_LOG_DEBUG("hardware: pass light");
}

void SimulatedSignalDevice::SignalFail() {
  ++fail_signals_;
  LINECHECK_LOG_INFO("hardware: fail light and alarm");
}

void SimulatedSignalDevice::HaltLine() {
  halted_ = true;
  LINECHECK_LOG_WARN("hardware: line halted");
}

void SimulatedSignalDevice::ResumeLine() {
  halted_ = false;
  LINECHECK_LOG_INFO("hardware: line resumed");
}

} // namespace linecheck::hardware
