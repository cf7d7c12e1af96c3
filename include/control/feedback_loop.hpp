#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <thread>

#include "core/state_owner.hpp"
#include "gateway/service_client.hpp"

namespace asset_agent::control {

struct FeedbackOptions {
  std::chrono::milliseconds period{5000};
  std::chrono::milliseconds request_timeout{5000};
  std::string output_unit{"Percent"};
};

enum class CycleOutcome : std::uint8_t {
  completed = 0,
  measurement_failed = 1,
  control_failed = 2,
  actuation_failed = 3,
  cancelled = 4,
};

const char* to_string(CycleOutcome outcome) noexcept;

// Control-period task closing the loop between an upstream measurement service and a
// downstream actuator service. Controller state lives in the owner; this task only moves
// values between the remote services and the owner's mailbox.
class FeedbackLoop {
 public:
  FeedbackLoop(FeedbackOptions options, core::StateOwner& owner, gateway::ServiceClient& upstream,
               gateway::ServiceClient& downstream);
  ~FeedbackLoop();

  FeedbackLoop(const FeedbackLoop&) = delete;
  FeedbackLoop& operator=(const FeedbackLoop&) = delete;

  void start(std::stop_token stop);
  void join();

  CycleOutcome cycle(const std::stop_token& stop);

  [[nodiscard]] std::uint64_t cycles() const noexcept;

 private:
  void run(std::stop_token stop);
  bool compute(double measured, double& output, const std::stop_token& stop);

  FeedbackOptions options_;
  core::StateOwner& owner_;
  gateway::ServiceClient& upstream_;
  gateway::ServiceClient& downstream_;
  std::thread thread_{};
  bool measurement_ok_{true};
  bool actuation_ok_{true};
  std::atomic<std::uint64_t> cycles_{0};
};

}  // namespace asset_agent::control
