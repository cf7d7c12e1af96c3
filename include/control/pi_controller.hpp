#pragma once

#include <chrono>

namespace asset_agent::control {

struct PiGains {
  double kp{5.0};
  double ki{0.0};
  // Integral decay time constant in seconds.
  double lambda_s{0.5};
};

// Proportional-integral law with exponential-decay anti-windup:
//   integral <- exp(-T / lambda) * integral + deviation * T
//   output   <- clamp(kp * deviation + ki * integral, [min, max])
class PiController {
 public:
  explicit PiController(PiGains gains = {}, std::chrono::duration<double> period = std::chrono::seconds(5),
                        double output_min = 0.0, double output_max = 100.0);

  // Advances the integral by one period and returns the clamped output. Never returns NaN.
  double update(double deviation) noexcept;

  void reset() noexcept;

  [[nodiscard]] double integral() const noexcept;
  [[nodiscard]] double last_output() const noexcept;
  [[nodiscard]] double decay() const noexcept;
  [[nodiscard]] const PiGains& gains() const noexcept;

 private:
  PiGains gains_;
  double period_s_;
  double decay_;
  double output_min_;
  double output_max_;
  double integral_{0.0};
  double last_output_{0.0};
};

}  // namespace asset_agent::control
