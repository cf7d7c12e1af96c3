#pragma once

#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "assets/unit_asset.hpp"
#include "bus/message_bus.hpp"
#include "bus/redis_topic.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::assets {

// "MyHouse/Kitchen/temperature" -> "MyHouse_Kitchen_temperature"
std::string topic_asset_name(const std::string& channel);

// Fills details from the channel's leading segments keyed by pattern and returns the last
// segment as the service definition. Throws std::runtime_error for a channel without '/'.
std::string apply_topic_pattern(const std::string& channel, const std::vector<std::string>& pattern,
                                model::Details& details);

// Last message seen on a bus channel. Writes publish to the same channel.
class TopicState final : public core::AssetState {
 public:
  TopicState(std::string service, std::string channel, std::string unit, std::unique_ptr<bus::MessagePublisher> publisher);

  void on_sample(const model::Signal& signal) override;
  model::Signal on_read(const std::string& service) override;
  void on_write(const std::string& service, const model::Signal& signal) override;

 private:
  std::string service_;
  std::string channel_;
  model::Signal latest_{};
  std::unique_ptr<bus::MessagePublisher> publisher_;
};

struct TopicOptions {
  std::string channel{};
  std::string service{"access"};
  std::string unit{};
};

class TopicAsset final : public UnitAsset {
 public:
  TopicAsset(AssetProfile profile, TopicOptions options, std::unique_ptr<bus::MessagePublisher> publisher,
             bus::RedisEndpoint endpoint, std::size_t mailbox_capacity, std::vector<sinks::SignalSink*> sinks = {});
  ~TopicAsset() override;

  void start(std::stop_token stop) override;
  void join() override;

  // Decodes one delivery and hands it to the owner. Returns false when the payload was dropped.
  bool deliver(const std::string& payload, const std::stop_token& stop);

 private:
  TopicOptions options_;
  std::vector<sinks::SignalSink*> sinks_;
  bus::TopicSubscriber subscriber_;
};

}  // namespace asset_agent::assets
