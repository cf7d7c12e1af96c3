#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "actuators/pulse_driver.hpp"
#include "assets/unit_asset.hpp"

namespace asset_agent::assets {

constexpr int kServoMinPulseUs = 620;
constexpr int kServoMaxPulseUs = 2420;
constexpr int kServoDefaultPosition = 50;

// Pulse width for a position in percent; 0 -> 620 us, 50 -> 1520 us, 100 -> 2420 us.
std::chrono::microseconds servo_pulse_width(int position) noexcept;

// Position is truncated to an integer percent and clamped to [0, 100].
int servo_position(double percent) noexcept;

class ServoState final : public core::AssetState {
 public:
  ServoState(std::string service, std::unique_ptr<actuators::PulseDriver> driver,
             int initial_position = kServoDefaultPosition);

  void on_start() override;
  void on_sample(const model::Signal& signal) override;
  model::Signal on_read(const std::string& service) override;
  void on_write(const std::string& service, const model::Signal& signal) override;
  void release() noexcept override;

 private:
  void drive(int position);

  std::string service_;
  std::unique_ptr<actuators::PulseDriver> driver_;
  int position_;
};

}  // namespace asset_agent::assets
