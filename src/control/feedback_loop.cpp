#include "control/feedback_loop.hpp"

#include <future>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/cancellation.hpp"

namespace asset_agent::control {

const char* to_string(const CycleOutcome outcome) noexcept {
  switch (outcome) {
    case CycleOutcome::completed:
      return "completed";
    case CycleOutcome::measurement_failed:
      return "measurement failed";
    case CycleOutcome::control_failed:
      return "control failed";
    case CycleOutcome::actuation_failed:
      return "actuation failed";
    case CycleOutcome::cancelled:
      return "cancelled";
  }
  return "unknown";
}

FeedbackLoop::FeedbackLoop(FeedbackOptions options, core::StateOwner& owner, gateway::ServiceClient& upstream,
                           gateway::ServiceClient& downstream)
    : options_(std::move(options)), owner_(owner), upstream_(upstream), downstream_(downstream) {
  if (options_.period <= std::chrono::milliseconds::zero()) {
    throw std::invalid_argument("control period of " + owner_.name() + " must be positive");
  }
}

FeedbackLoop::~FeedbackLoop() { join(); }

void FeedbackLoop::start(std::stop_token stop) {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this, stop = std::move(stop)] { run(stop); });
}

void FeedbackLoop::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void FeedbackLoop::run(const std::stop_token stop) {
  core::PeriodicTimer timer(options_.period);
  while (timer.wait(stop)) {
    cycle(stop);
  }
}

CycleOutcome FeedbackLoop::cycle(const std::stop_token& stop) {
  ++cycles_;
  const auto started = std::chrono::steady_clock::now();

  model::Signal measurement{};
  std::string error;
  if (!upstream_.get_state(measurement, error, stop)) {
    if (stop.stop_requested()) {
      return CycleOutcome::cancelled;
    }
    if (measurement_ok_) {
      std::cerr << "[control] " << owner_.name() << ": unable to obtain a reading from " << upstream_.describe()
                << ": " << error << '\n';
      measurement_ok_ = false;
    }
    return CycleOutcome::measurement_failed;
  }
  if (!measurement_ok_) {
    std::cerr << "[control] " << owner_.name() << ": readings from " << upstream_.describe() << " recovered\n";
    measurement_ok_ = true;
  }
  if (stop.stop_requested()) {
    return CycleOutcome::cancelled;
  }

  double output = 0.0;
  if (!compute(measurement.value, output, stop)) {
    return stop.stop_requested() ? CycleOutcome::cancelled : CycleOutcome::control_failed;
  }

  model::Signal command{};
  command.value = output;
  command.unit = options_.output_unit;
  command.timestamp = std::chrono::system_clock::now();

  const bool pushed = downstream_.set_state(command, error, stop);
  if (!pushed && stop.stop_requested()) {
    return CycleOutcome::cancelled;
  }
  if (pushed != actuation_ok_) {
    if (pushed) {
      std::cerr << "[control] " << owner_.name() << ": updates to " << downstream_.describe() << " recovered\n";
    } else {
      std::cerr << "[control] " << owner_.name() << ": cannot update " << downstream_.describe() << ": " << error
                << '\n';
    }
    actuation_ok_ = pushed;
  }

  const auto elapsed =
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - started);
  if (!owner_.report(core::JitterReport{elapsed}, stop)) {
    return CycleOutcome::cancelled;
  }
  return pushed ? CycleOutcome::completed : CycleOutcome::actuation_failed;
}

bool FeedbackLoop::compute(const double measured, double& output, const std::stop_token& stop) {
  core::ControlStep step{};
  step.measured = measured;
  auto result = step.output.get_future();

  const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
  const auto status = owner_.post(std::move(step), deadline, stop);
  if (status != core::MailboxStatus::accepted) {
    std::cerr << "[control] " << owner_.name() << ": control step not accepted (" << core::to_string(status)
              << ")\n";
    return false;
  }

  if (result.wait_until(deadline) != std::future_status::ready) {
    std::cerr << "[control] " << owner_.name() << ": control step timed out\n";
    return false;
  }

  try {
    output = result.get();
  } catch (const std::exception& ex) {
    std::cerr << "[control] " << owner_.name() << ": control step failed: " << ex.what() << '\n';
    return false;
  }
  return true;
}

std::uint64_t FeedbackLoop::cycles() const noexcept { return cycles_.load(); }

}  // namespace asset_agent::control
