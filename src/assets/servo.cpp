#include "assets/servo.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace asset_agent::assets {

std::chrono::microseconds servo_pulse_width(const int position) noexcept {
  const int clamped = std::clamp(position, 0, 100);
  return std::chrono::microseconds(clamped * (kServoMaxPulseUs - kServoMinPulseUs) / 100 + kServoMinPulseUs);
}

int servo_position(const double percent) noexcept {
  return static_cast<int>(std::trunc(core::clamp_percent(percent)));
}

ServoState::ServoState(std::string service, std::unique_ptr<actuators::PulseDriver> driver,
                       const int initial_position)
    : service_(std::move(service)), driver_(std::move(driver)), position_(std::clamp(initial_position, 0, 100)) {}

void ServoState::on_start() { drive(position_); }

void ServoState::on_sample(const model::Signal& /*signal*/) {}

model::Signal ServoState::on_read(const std::string& service) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  model::Signal signal{};
  signal.value = static_cast<double>(position_);
  signal.unit = "Percent";
  signal.timestamp = std::chrono::system_clock::now();
  return signal;
}

void ServoState::on_write(const std::string& service, const model::Signal& signal) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  try {
    drive(servo_position(signal.value));
  } catch (const core::DeviceError& ex) {
    throw core::ServiceError(core::ServiceErrorKind::device, ex.what());
  }
}

void ServoState::release() noexcept {
  driver_->release();
  std::cerr << "[servo] output released\n";
}

void ServoState::drive(const int position) {
  driver_->set_pulse_width(servo_pulse_width(position));
  position_ = position;
}

}  // namespace asset_agent::assets
