#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <variant>

#include "model/signal.hpp"

namespace asset_agent::core {

enum class Action : std::uint8_t {
  read = 0,
  write = 1,
};

// Request envelope from a gateway. The reply promise is single-use: the owner fulfils it
// (value or exception) exactly once, and an envelope dropped unprocessed breaks it, so a
// waiting requester is always released.
struct Tray {
  Action action{Action::read};
  std::string service{};
  model::Signal payload{};
  std::promise<model::Signal> reply{};
};

// Fresh reading from a sampler or a topic delivery. Overwrites the stored signal.
struct SampleUpdate {
  model::Signal signal{};
};

// Measurement handed to the owner by its feedback loop; the owner answers with the actuator output.
struct ControlStep {
  double measured{0.0};
  std::promise<double> output{};
};

struct JitterReport {
  std::chrono::nanoseconds elapsed{};
};

using Envelope = std::variant<SampleUpdate, Tray, ControlStep, JitterReport>;

}  // namespace asset_agent::core
