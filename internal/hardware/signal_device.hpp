#pragma once

#include <memory>
#include <string>

namespace linecheck::hardware {

/*
  Line signalling capability: pass/fail indicators and the line stop.
  Implementations may throw; callers go through InvokeSignal so a faulty
  device never aborts a scan.
*/
class SignalDevice {
 public:
  virtual ~SignalDevice() = default;

  virtual void SignalPass() = 0;
  virtual void SignalFail() = 0;
  virtual void HaltLine()   = 0;
  virtual void ResumeLine() = 0;

  virtual bool Enabled() const = 0;
};

enum class Signal { kPass, kFail, kHalt, kResume };

const char* ToString(Signal signal);

// Calls the device and logs any std::exception at error level.
void InvokeSignal(SignalDevice& device, Signal signal);

// "simulated" logs each call; "disabled" ignores them.
std::shared_ptr<SignalDevice> MakeSignalDevice(const std::string& mode);

} // namespace linecheck::hardware
