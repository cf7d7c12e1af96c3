#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "core/mailbox.hpp"
#include "core/tray.hpp"
#include "model/signal.hpp"

namespace asset_agent::core {

constexpr std::size_t kDefaultMailboxCapacity = 16;

// Live state of one asset. Every method runs on the owner thread, one envelope at a time.
class AssetState {
 public:
  virtual ~AssetState() = default;

  // First step of the owner thread, before any envelope is processed.
  virtual void on_start() {}

  virtual void on_sample(const model::Signal& signal) = 0;

  // Throw ServiceError or DeviceError to answer on the error channel.
  virtual model::Signal on_read(const std::string& service) = 0;
  virtual void on_write(const std::string& service, const model::Signal& signal) = 0;

  virtual double on_control(double measured);
  virtual void on_jitter(std::chrono::nanoseconds elapsed);

  // Terminal step. Device handles are de-energised here.
  virtual void release() noexcept {}
};

class StateOwner {
 public:
  StateOwner(std::string asset_name, std::unique_ptr<AssetState> state,
             std::size_t mailbox_capacity = kDefaultMailboxCapacity);
  ~StateOwner();

  StateOwner(const StateOwner&) = delete;
  StateOwner& operator=(const StateOwner&) = delete;

  void start(std::stop_token stop);
  void join();

  // Sampler path. Blocks while the mailbox is full; gives up when stop is requested.
  bool deliver(model::Signal sample, const std::stop_token& stop);

  MailboxStatus post(Tray tray, std::chrono::steady_clock::time_point deadline);
  MailboxStatus post(ControlStep step, std::chrono::steady_clock::time_point deadline, const std::stop_token& stop);
  bool report(JitterReport report, const std::stop_token& stop);

  [[nodiscard]] const std::string& name() const noexcept;
  [[nodiscard]] std::size_t pending() const;

 private:
  void run(std::stop_token stop);
  void dispatch(Envelope& envelope);
  void handle(Tray& tray);
  void handle(ControlStep& step);

  std::string name_;
  std::unique_ptr<AssetState> state_;
  Mailbox<Envelope> mailbox_;
  std::thread thread_{};
};

}  // namespace asset_agent::core
