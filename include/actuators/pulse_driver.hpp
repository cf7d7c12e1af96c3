#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace asset_agent::actuators {

class PulseDriver {
 public:
  // Throws core::DeviceError when the output rejects the width.
  virtual void set_pulse_width(std::chrono::microseconds width) = 0;
  // Disables the output. Safe to call more than once.
  virtual void release() noexcept = 0;
  virtual ~PulseDriver() = default;
};

struct SysfsPwmOptions {
  std::string chip_path{"/sys/class/pwm/pwmchip0"};
  unsigned channel{0};
  std::chrono::microseconds period{20000};
};

std::unique_ptr<PulseDriver> make_sysfs_pwm_driver(SysfsPwmOptions options);

}  // namespace asset_agent::actuators
