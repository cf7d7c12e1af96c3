#include "core/state_owner.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "core/errors.hpp"

namespace asset_agent::core {

double AssetState::on_control(const double /*measured*/) {
  throw ServiceError(ServiceErrorKind::unsupported, "asset has no control loop");
}

void AssetState::on_jitter(const std::chrono::nanoseconds /*elapsed*/) {}

StateOwner::StateOwner(std::string asset_name, std::unique_ptr<AssetState> state, const std::size_t mailbox_capacity)
    : name_(std::move(asset_name)), state_(std::move(state)), mailbox_(mailbox_capacity) {}

StateOwner::~StateOwner() { join(); }

void StateOwner::start(std::stop_token stop) {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this, stop = std::move(stop)] { run(stop); });
}

void StateOwner::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StateOwner::deliver(model::Signal sample, const std::stop_token& stop) {
  return mailbox_.push(SampleUpdate{std::move(sample)}, stop) == MailboxStatus::accepted;
}

MailboxStatus StateOwner::post(Tray tray, const std::chrono::steady_clock::time_point deadline) {
  return mailbox_.push_until(std::move(tray), deadline, std::stop_token{});
}

MailboxStatus StateOwner::post(ControlStep step, const std::chrono::steady_clock::time_point deadline,
                               const std::stop_token& stop) {
  return mailbox_.push_until(std::move(step), deadline, stop);
}

bool StateOwner::report(JitterReport report, const std::stop_token& stop) {
  return mailbox_.push(report, stop) == MailboxStatus::accepted;
}

const std::string& StateOwner::name() const noexcept { return name_; }

std::size_t StateOwner::pending() const { return mailbox_.size(); }

void StateOwner::run(const std::stop_token stop) {
  try {
    state_->on_start();
  } catch (const std::exception& ex) {
    std::cerr << "[owner] " << name_ << " start-up command failed: " << ex.what() << '\n';
  }

  while (auto envelope = mailbox_.pop(stop)) {
    dispatch(*envelope);
  }

  state_->release();
  mailbox_.close();
  std::cerr << "[owner] " << name_ << " stopped\n";
}

void StateOwner::dispatch(Envelope& envelope) {
  if (auto* update = std::get_if<SampleUpdate>(&envelope)) {
    state_->on_sample(update->signal);
    return;
  }
  if (auto* tray = std::get_if<Tray>(&envelope)) {
    handle(*tray);
    return;
  }
  if (auto* step = std::get_if<ControlStep>(&envelope)) {
    handle(*step);
    return;
  }
  if (auto* jitter = std::get_if<JitterReport>(&envelope)) {
    state_->on_jitter(jitter->elapsed);
  }
}

void StateOwner::handle(Tray& tray) {
  try {
    if (tray.action == Action::read) {
      tray.reply.set_value(state_->on_read(tray.service));
      return;
    }
    state_->on_write(tray.service, tray.payload);
    tray.reply.set_value(tray.payload);
  } catch (const std::exception&) {
    tray.reply.set_exception(std::current_exception());
  }
}

void StateOwner::handle(ControlStep& step) {
  try {
    step.output.set_value(state_->on_control(step.measured));
  } catch (const std::exception&) {
    step.output.set_exception(std::current_exception());
  }
}

}  // namespace asset_agent::core
