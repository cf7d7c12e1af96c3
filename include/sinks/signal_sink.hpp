#pragma once

#include <string>

#include "model/signal.hpp"

namespace asset_agent::sinks {

struct SignalRecord {
  std::string asset{};
  std::string service{};
  model::Signal signal{};
};

// Observer of accepted samples. publish() must not block the caller for long.
class SignalSink {
 public:
  virtual void publish(const SignalRecord& record) = 0;
  virtual ~SignalSink() = default;
};

}  // namespace asset_agent::sinks
