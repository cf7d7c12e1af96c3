#include "assets/sampled_asset.hpp"

#include <utility>

#include "core/errors.hpp"

namespace asset_agent::assets {

SampledState::SampledState(std::string service, std::string unit, std::unique_ptr<actuators::Actuator> actuator)
    : service_(std::move(service)), actuator_(std::move(actuator)) {
  latest_.unit = std::move(unit);
}

void SampledState::on_sample(const model::Signal& signal) { latest_ = signal; }

model::Signal SampledState::on_read(const std::string& service) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  return latest_;
}

void SampledState::on_write(const std::string& service, const model::Signal& signal) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  if (actuator_ == nullptr) {
    throw core::ServiceError(core::ServiceErrorKind::unsupported, service + " is read-only");
  }
  try {
    actuator_->command(signal.value);
  } catch (const core::DeviceError& ex) {
    throw core::ServiceError(core::ServiceErrorKind::device, ex.what());
  }
}

void SampledState::release() noexcept {
  if (actuator_ != nullptr) {
    actuator_->release();
  }
}

SampledAsset::SampledAsset(AssetProfile profile, core::SamplerOptions sampler,
                           std::unique_ptr<sensors::SampleSource> source, core::Normalizer normalize,
                           std::unique_ptr<actuators::Actuator> actuator, const std::size_t mailbox_capacity,
                           std::vector<sinks::SignalSink*> sinks)
    : UnitAsset(std::move(profile), std::make_unique<SampledState>(sampler.service, sampler.unit, std::move(actuator)),
                mailbox_capacity),
      source_(std::move(source)),
      sampler_(std::move(sampler), *source_, std::move(normalize), owner(), std::move(sinks)) {}

SampledAsset::~SampledAsset() { SampledAsset::join(); }

void SampledAsset::start(std::stop_token stop) {
  UnitAsset::start(stop);
  sampler_.start(std::move(stop));
}

void SampledAsset::join() {
  sampler_.join();
  UnitAsset::join();
}

core::SamplerLoop& SampledAsset::sampler() noexcept { return sampler_; }

}  // namespace asset_agent::assets
