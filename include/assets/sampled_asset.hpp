#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "actuators/actuator.hpp"
#include "assets/unit_asset.hpp"
#include "core/sampler.hpp"
#include "sensors/sample_source.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::assets {

// Last accepted sample of one service, plus an optional output for writes.
class SampledState final : public core::AssetState {
 public:
  SampledState(std::string service, std::string unit, std::unique_ptr<actuators::Actuator> actuator = nullptr);

  void on_sample(const model::Signal& signal) override;
  model::Signal on_read(const std::string& service) override;
  void on_write(const std::string& service, const model::Signal& signal) override;
  void release() noexcept override;

 private:
  std::string service_;
  model::Signal latest_{};
  std::unique_ptr<actuators::Actuator> actuator_;
};

// Asset fed by a periodic sampler: 1-wire thermometers and analogue I/O channels.
class SampledAsset final : public UnitAsset {
 public:
  SampledAsset(AssetProfile profile, core::SamplerOptions sampler, std::unique_ptr<sensors::SampleSource> source,
               core::Normalizer normalize, std::unique_ptr<actuators::Actuator> actuator, std::size_t mailbox_capacity,
               std::vector<sinks::SignalSink*> sinks = {});
  ~SampledAsset() override;

  void start(std::stop_token stop) override;
  void join() override;

  core::SamplerLoop& sampler() noexcept;

 private:
  std::unique_ptr<sensors::SampleSource> source_;
  core::SamplerLoop sampler_;
};

}  // namespace asset_agent::assets
