#include "sinks/stdout_debug.hpp"

#include <cstdio>

#include "model/signal_form.hpp"

namespace asset_agent::sinks {

void StdoutDebugSink::publish(const SignalRecord& record) {
  const std::string stamp = model::format_rfc3339(record.signal.timestamp);
  std::lock_guard<std::mutex> lock(mutex_);
  std::printf("[sample] %s/%s=%.3f %s @ %s\n", record.asset.c_str(), record.service.c_str(), record.signal.value,
              record.signal.unit.c_str(), stamp.c_str());
  std::fflush(stdout);
}

}  // namespace asset_agent::sinks
