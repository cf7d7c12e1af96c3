#pragma once

#include <chrono>
#include <string>

#include "sensors/sample_source.hpp"

namespace asset_agent::sensors {

constexpr const char* kDefaultIoTool = "/usr/bin/piTest";

// Analogue channel of an I/O module driven through its command-line tool.
// Raw counts are millivolts of a 0..10 V channel unless min/max say otherwise.
struct IoChannelOptions {
  std::string tool{kDefaultIoTool};
  std::string address{};
  double min_value{0.0};
  double max_value{10000.0};
  std::chrono::milliseconds timeout{2000};
};

// Reads raw counts with `<tool> -1 -q -r <address>`.
class IoChannelInput final : public SampleSource {
 public:
  explicit IoChannelInput(IoChannelOptions options);

  bool read(double& raw) noexcept override;

  [[nodiscard]] const IoChannelOptions& options() const noexcept;

 private:
  IoChannelOptions options_;
};

}  // namespace asset_agent::sensors
