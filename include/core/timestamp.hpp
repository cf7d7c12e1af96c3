#pragma once

#include <chrono>
#include <cstdint>

namespace asset_agent::core {

inline std::uint64_t unix_timestamp_ms(const std::chrono::system_clock::time_point timestamp) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count());
}

inline double to_milliseconds(const std::chrono::nanoseconds elapsed) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(elapsed).count();
}

}  // namespace asset_agent::core
