#include "control/pi_controller.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace asset_agent::control {

namespace {
constexpr double kFiniteMax = std::numeric_limits<double>::max();

double bound(const double value) noexcept { return std::clamp(value, -kFiniteMax, kFiniteMax); }
}  // namespace

PiController::PiController(const PiGains gains, const std::chrono::duration<double> period, const double output_min,
                           const double output_max)
    : gains_(gains),
      period_s_(period.count()),
      decay_(gains.lambda_s > 0.0 ? std::exp(-period.count() / gains.lambda_s) : 0.0),
      output_min_(output_min),
      output_max_(output_max),
      last_output_(output_min) {}

double PiController::update(const double deviation) noexcept {
  if (std::isnan(deviation)) {
    return last_output_;
  }

  const double error = bound(deviation);
  integral_ = bound((decay_ * integral_) + (error * period_s_));

  const double p_term = gains_.kp == 0.0 ? 0.0 : gains_.kp * error;
  const double i_term = gains_.ki == 0.0 ? 0.0 : gains_.ki * integral_;
  const double output = p_term + i_term;

  if (std::isnan(output)) {
    return last_output_;
  }

  last_output_ = std::clamp(output, output_min_, output_max_);
  return last_output_;
}

void PiController::reset() noexcept {
  integral_ = 0.0;
  last_output_ = output_min_;
}

double PiController::integral() const noexcept { return integral_; }

double PiController::last_output() const noexcept { return last_output_; }

double PiController::decay() const noexcept { return decay_; }

const PiGains& PiController::gains() const noexcept { return gains_; }

}  // namespace asset_agent::control
