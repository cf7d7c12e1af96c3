#include "actuators/io_channel_output.hpp"

#include <utility>

#include "core/errors.hpp"
#include "core/math.hpp"
#include "sensors/process.hpp"

namespace asset_agent::actuators {

IoChannelOutput::IoChannelOutput(sensors::IoChannelOptions options) : options_(std::move(options)) {}

void IoChannelOutput::command(const double percent) {
  const std::string argument = options_.address + "," + std::to_string(to_raw(percent));

  sensors::ProcessResult result{};
  if (!sensors::run_process({options_.tool, "-w", argument}, options_.timeout, result)) {
    throw core::DeviceError("cannot run " + options_.tool);
  }
  if (result.timed_out) {
    throw core::DeviceError(options_.tool + " timed out writing " + options_.address);
  }
  if (result.exit_code != 0) {
    throw core::DeviceError(options_.tool + " exited with " + std::to_string(result.exit_code) + " writing " +
                            options_.address);
  }
}

long long IoChannelOutput::to_raw(const double percent) const noexcept {
  return static_cast<long long>(core::percent_to_scale(percent, options_.min_value, options_.max_value));
}

}  // namespace asset_agent::actuators
