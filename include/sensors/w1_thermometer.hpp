#pragma once

#include <string>

#include "sensors/sample_source.hpp"

namespace asset_agent::sensors {

constexpr const char* kW1DeviceRoot = "/sys/bus/w1/devices";

// DS18B20-style 1-wire thermometer exposed by the w1_therm kernel driver.
class W1Thermometer final : public SampleSource {
 public:
  explicit W1Thermometer(const std::string& sensor_id, const std::string& device_root = kW1DeviceRoot);

  // Celsius. False on a missing file, a CRC failure or a line without t=.
  bool read(double& celsius) noexcept override;

  [[nodiscard]] const std::string& path() const noexcept;

  // w1_slave holds two lines: the CRC check ending in YES/NO and the raw scratchpad ending in t=<milli-C>.
  static bool parse_w1_slave(const std::string& contents, double& celsius) noexcept;

 private:
  std::string path_;
};

}  // namespace asset_agent::sensors
