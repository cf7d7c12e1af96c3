#pragma once

#include <chrono>
#include <string>

namespace asset_agent::model {

// Canonical unit of data exchanged between samplers, owners and gateways.
struct Signal {
  double value{0.0};
  std::string unit{};
  std::chrono::system_clock::time_point timestamp{};
};

}  // namespace asset_agent::model
