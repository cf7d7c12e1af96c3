#pragma once

#include <algorithm>
#include <cmath>

namespace asset_agent::core {

constexpr double kPercentMin = 0.0;
constexpr double kPercentMax = 100.0;

inline double clamp_percent(const double value) noexcept {
  if (std::isnan(value)) {
    return kPercentMin;
  }
  return std::clamp(value, kPercentMin, kPercentMax);
}

// Linear map of [min, max] onto [0, 100], clamped.
inline double scale_to_percent(const double raw, const double min, const double max) noexcept {
  if (!(max > min)) {
    return kPercentMin;
  }
  return clamp_percent((raw - min) * kPercentMax / (max - min));
}

inline double percent_to_scale(const double percent, const double min, const double max) noexcept {
  return (clamp_percent(percent) * (max - min) / kPercentMax) + min;
}

}  // namespace asset_agent::core
