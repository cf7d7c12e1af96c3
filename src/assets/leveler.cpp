#include "assets/leveler.hpp"

#include <iomanip>
#include <iostream>
#include <utility>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace asset_agent::assets {
namespace {

model::Signal now_signal(const double value, const char* unit) {
  model::Signal signal{};
  signal.value = value;
  signal.unit = unit;
  signal.timestamp = std::chrono::system_clock::now();
  return signal;
}

}  // namespace

LevelerState::LevelerState(std::string name, LevelerTraits traits)
    : name_(std::move(name)), set_point_(traits.set_point), controller_(traits.gains, traits.period) {}

void LevelerState::on_sample(const model::Signal& /*signal*/) {}

model::Signal LevelerState::on_read(const std::string& service) {
  if (service == "setpoint") {
    return now_signal(set_point_, "Percent");
  }
  if (service == "levelerror") {
    return now_signal(deviation_, "Percent");
  }
  if (service == "jitter") {
    return now_signal(core::to_milliseconds(jitter_), "millisecond");
  }
  throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
}

void LevelerState::on_write(const std::string& service, const model::Signal& signal) {
  if (service == "levelerror" || service == "jitter") {
    throw core::ServiceError(core::ServiceErrorKind::unsupported, service + " is read-only");
  }
  if (service != "setpoint") {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  set_point_ = signal.value;
  std::cerr << "[control] " << name_ << ": new set point " << std::fixed << std::setprecision(1) << set_point_
            << '\n';
}

double LevelerState::on_control(const double measured) {
  deviation_ = set_point_ - measured;
  const double output = controller_.update(deviation_);

  if (!logged_once_ || deviation_ != logged_deviation_) {
    std::cerr << "[control] " << name_ << ": level " << std::fixed << std::setprecision(2) << measured
              << "% deviation " << deviation_ << "% output " << output << "%\n";
    logged_once_ = true;
    logged_deviation_ = deviation_;
  }
  return output;
}

void LevelerState::on_jitter(const std::chrono::nanoseconds elapsed) { jitter_ = elapsed; }

LevelerAsset::LevelerAsset(AssetProfile profile, LevelerTraits traits,
                           std::unique_ptr<gateway::ServiceClient> upstream,
                           std::unique_ptr<gateway::ServiceClient> downstream,
                           const std::chrono::milliseconds request_timeout, const std::size_t mailbox_capacity)
    : UnitAsset(std::move(profile), std::make_unique<LevelerState>(profile.name, traits), mailbox_capacity),
      upstream_(std::move(upstream)),
      downstream_(std::move(downstream)),
      loop_(control::FeedbackOptions{traits.period, request_timeout, "Percent"}, owner(), *upstream_, *downstream_) {}

LevelerAsset::~LevelerAsset() { LevelerAsset::join(); }

void LevelerAsset::start(std::stop_token stop) {
  UnitAsset::start(stop);
  loop_.start(std::move(stop));
}

void LevelerAsset::join() {
  loop_.join();
  UnitAsset::join();
}

control::FeedbackLoop& LevelerAsset::loop() noexcept { return loop_; }

}  // namespace asset_agent::assets
