#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>

#include "bus/message_bus.hpp"
#include "bus/redis_connection.hpp"

namespace asset_agent::bus {

class RedisPublisher final : public MessagePublisher {
 public:
  explicit RedisPublisher(RedisEndpoint endpoint);

  void publish(const std::string& channel, const std::string& payload) override;

 private:
  bool try_publish(const std::string& channel, const std::string& payload, std::string& error);

  RedisEndpoint endpoint_;
  RedisContextPtr context_{};
};

using MessageHandler = std::function<void(const std::string& payload, const std::stop_token& stop)>;

// Dedicated connection in SUBSCRIBE mode. Lost connections are retried until stop is requested;
// stopping shuts the socket down so a blocked read returns immediately.
class TopicSubscriber {
 public:
  TopicSubscriber(RedisEndpoint endpoint, std::string channel, MessageHandler on_message,
                  std::chrono::milliseconds retry_delay = std::chrono::milliseconds(1000));
  ~TopicSubscriber();

  TopicSubscriber(const TopicSubscriber&) = delete;
  TopicSubscriber& operator=(const TopicSubscriber&) = delete;

  void start(std::stop_token stop);
  void join();

  [[nodiscard]] const std::string& channel() const noexcept;
  [[nodiscard]] std::uint64_t received() const noexcept;

 private:
  void run(std::stop_token stop);
  bool listen(redisContext* context, const std::stop_token& stop, std::string& error);

  RedisEndpoint endpoint_;
  std::string channel_;
  MessageHandler on_message_;
  std::chrono::milliseconds retry_delay_;
  std::thread thread_{};
  std::atomic<int> active_fd_{-1};
  std::atomic<std::uint64_t> received_{0};
};

}  // namespace asset_agent::bus
