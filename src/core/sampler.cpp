#include "core/sampler.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/cancellation.hpp"

namespace asset_agent::core {

SamplerLoop::SamplerLoop(SamplerOptions options, sensors::SampleSource& source, Normalizer normalize,
                         StateOwner& owner, std::vector<sinks::SignalSink*> sinks)
    : options_(std::move(options)),
      source_(source),
      normalize_(std::move(normalize)),
      owner_(owner),
      sinks_(std::move(sinks)) {
  if (options_.period <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("sampling period of " + owner_.name() + " must be positive");
  }
}

SamplerLoop::~SamplerLoop() { join(); }

void SamplerLoop::start(std::stop_token stop) {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this, stop = std::move(stop)] { run(stop); });
}

void SamplerLoop::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SamplerLoop::run(const std::stop_token stop) {
  PeriodicTimer timer(options_.period);
  while (timer.wait(stop)) {
    tick(stop);
  }
}

bool SamplerLoop::tick(const std::stop_token& stop) {
  ++ticks_;

  double raw = 0.0;
  const bool ok = source_.read(raw) && std::isfinite(raw);
  if (!ok) {
    ++failures_;
    if (source_was_ok_) {
      std::cerr << "[sampler] " << owner_.name() << ": read failed, skipping until the source recovers\n";
      source_was_ok_ = false;
    }
    return false;
  }
  if (!source_was_ok_) {
    std::cerr << "[sampler] " << owner_.name() << ": read recovered\n";
    source_was_ok_ = true;
  }

  model::Signal signal{};
  signal.value = normalize_ ? normalize_(raw) : raw;
  signal.unit = options_.unit;
  signal.timestamp = std::chrono::system_clock::now();

  if (!owner_.deliver(signal, stop)) {
    return false;
  }
  ++delivered_;

  for (auto* sink : sinks_) {
    sink->publish(sinks::SignalRecord{owner_.name(), options_.service, signal});
  }
  return true;
}

std::uint64_t SamplerLoop::ticks() const noexcept { return ticks_.load(); }

std::uint64_t SamplerLoop::failures() const noexcept { return failures_.load(); }

std::uint64_t SamplerLoop::delivered() const noexcept { return delivered_.load(); }

}  // namespace asset_agent::core
