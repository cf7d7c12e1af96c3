#pragma once

#include <mutex>

#include "sinks/signal_sink.hpp"

namespace asset_agent::sinks {

class StdoutDebugSink final : public SignalSink {
 public:
  void publish(const SignalRecord& record) override;

 private:
  std::mutex mutex_;
};

}  // namespace asset_agent::sinks
