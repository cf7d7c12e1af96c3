#pragma once

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>

#include "assets/unit_asset.hpp"
#include "control/feedback_loop.hpp"
#include "control/pi_controller.hpp"
#include "gateway/service_client.hpp"

namespace asset_agent::assets {

struct LevelerTraits {
  double set_point{20.0};
  std::chrono::milliseconds period{5000};
  control::PiGains gains{};
  std::string measurement{"level"};
  std::string actuator{"pumpSpeed"};
};

// Set point, controller memory and the last deviation and jitter of one level loop.
class LevelerState final : public core::AssetState {
 public:
  LevelerState(std::string name, LevelerTraits traits);

  void on_sample(const model::Signal& signal) override;
  model::Signal on_read(const std::string& service) override;
  void on_write(const std::string& service, const model::Signal& signal) override;
  double on_control(double measured) override;
  void on_jitter(std::chrono::nanoseconds elapsed) override;

 private:
  std::string name_;
  double set_point_;
  control::PiController controller_;
  double deviation_{0.0};
  bool logged_once_{false};
  double logged_deviation_{0.0};
  std::chrono::nanoseconds jitter_{};
};

// Closes a level loop between a remote measurement service and a remote actuator service.
class LevelerAsset final : public UnitAsset {
 public:
  LevelerAsset(AssetProfile profile, LevelerTraits traits, std::unique_ptr<gateway::ServiceClient> upstream,
               std::unique_ptr<gateway::ServiceClient> downstream, std::chrono::milliseconds request_timeout,
               std::size_t mailbox_capacity);
  ~LevelerAsset() override;

  void start(std::stop_token stop) override;
  void join() override;

  control::FeedbackLoop& loop() noexcept;

 private:
  std::unique_ptr<gateway::ServiceClient> upstream_;
  std::unique_ptr<gateway::ServiceClient> downstream_;
  control::FeedbackLoop loop_;
};

}  // namespace asset_agent::assets
