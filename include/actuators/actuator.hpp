#pragma once

namespace asset_agent::actuators {

// Device-level output. command() throws core::DeviceError when the device rejects it.
class Actuator {
 public:
  virtual void command(double value) = 0;
  virtual void release() noexcept {}
  virtual ~Actuator() = default;
};

}  // namespace asset_agent::actuators
