#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "core/state_owner.hpp"
#include "sensors/sample_source.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::core {

using Normalizer = std::function<double(double)>;

struct SamplerOptions {
  std::string service{};
  std::string unit{};
  std::chrono::milliseconds period{1000};
};

// Periodic acquisition for one asset. A failed read skips the tick; the owner never sees it.
class SamplerLoop {
 public:
  SamplerLoop(SamplerOptions options, sensors::SampleSource& source, Normalizer normalize, StateOwner& owner,
              std::vector<sinks::SignalSink*> sinks = {});
  ~SamplerLoop();

  SamplerLoop(const SamplerLoop&) = delete;
  SamplerLoop& operator=(const SamplerLoop&) = delete;

  void start(std::stop_token stop);
  void join();

  // One acquisition. Returns true when a sample reached the owner.
  bool tick(const std::stop_token& stop);

  [[nodiscard]] std::uint64_t ticks() const noexcept;
  [[nodiscard]] std::uint64_t failures() const noexcept;
  [[nodiscard]] std::uint64_t delivered() const noexcept;

 private:
  void run(std::stop_token stop);

  SamplerOptions options_;
  sensors::SampleSource& source_;
  Normalizer normalize_;
  StateOwner& owner_;
  std::vector<sinks::SignalSink*> sinks_;
  std::thread thread_{};
  bool source_was_ok_{true};
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> failures_{0};
  std::atomic<std::uint64_t> delivered_{0};
};

}  // namespace asset_agent::core
