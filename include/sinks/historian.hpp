#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stop_token>
#include <thread>

#include "core/mailbox.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::sinks {

constexpr std::size_t kHistorianQueueCapacity = 256;
constexpr std::size_t kHistorianBatchSize = 64;

// Hands accepted samples to a worker that writes them to RedisTimeSeries in batches.
// publish() never blocks: records arriving while the queue is full are dropped and counted.
class Historian final : public SignalSink {
 public:
  explicit Historian(RedisTsOptions options, std::size_t queue_capacity = kHistorianQueueCapacity);
  ~Historian() override;

  Historian(const Historian&) = delete;
  Historian& operator=(const Historian&) = delete;

  void publish(const SignalRecord& record) override;

  void start(std::stop_token stop);
  void join();

  // Writes whatever is queued, up to one batch. Returns false when the batch was lost.
  bool flush_once(const std::stop_token& stop);

  [[nodiscard]] std::uint64_t dropped() const noexcept;
  [[nodiscard]] std::uint64_t written() const noexcept;

 private:
  void run(std::stop_token stop);

  RedisTsSink writer_;
  core::Mailbox<SignalRecord> queue_;
  std::thread thread_{};
  bool redis_was_ok_{true};
  std::atomic<std::uint64_t> dropped_{0};
  std::atomic<std::uint64_t> written_{0};
};

}  // namespace asset_agent::sinks
