#pragma once

#include "actuators/actuator.hpp"
#include "sensors/io_channel.hpp"

namespace asset_agent::actuators {

// Writes a percentage to an analogue output with `<tool> -w <address>,<raw>`.
class IoChannelOutput final : public Actuator {
 public:
  explicit IoChannelOutput(sensors::IoChannelOptions options);

  void command(double percent) override;

  // trunc(clamp(percent) * (max - min) / 100 + min)
  [[nodiscard]] long long to_raw(double percent) const noexcept;

 private:
  sensors::IoChannelOptions options_;
};

}  // namespace asset_agent::actuators
