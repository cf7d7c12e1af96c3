#include "assets/topic_asset.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/errors.hpp"
#include "model/signal_form.hpp"

namespace asset_agent::assets {

std::string topic_asset_name(const std::string& channel) {
  std::string name = channel;
  std::replace(name.begin(), name.end(), '/', '_');
  return name;
}

std::string apply_topic_pattern(const std::string& channel, const std::vector<std::string>& pattern,
                                model::Details& details) {
  const auto last_slash = channel.rfind('/');
  if (last_slash == std::string::npos) {
    throw std::runtime_error("topic " + channel + " has no '/' to match its pattern");
  }

  std::vector<std::string> segments;
  std::size_t begin = 0;
  const std::string prefix = channel.substr(0, last_slash);
  while (begin <= prefix.size()) {
    const auto end = prefix.find('/', begin);
    segments.push_back(prefix.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
    if (end == std::string::npos) {
      break;
    }
    begin = end + 1;
  }

  for (std::size_t i = 0; i < pattern.size() && i < segments.size(); ++i) {
    details[pattern[i]].push_back(segments[i]);
  }
  return channel.substr(last_slash + 1);
}

TopicState::TopicState(std::string service, std::string channel, std::string unit,
                       std::unique_ptr<bus::MessagePublisher> publisher)
    : service_(std::move(service)), channel_(std::move(channel)), publisher_(std::move(publisher)) {
  latest_.unit = std::move(unit);
}

void TopicState::on_sample(const model::Signal& signal) { latest_ = signal; }

model::Signal TopicState::on_read(const std::string& service) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  return latest_;
}

void TopicState::on_write(const std::string& service, const model::Signal& signal) {
  if (service != service_) {
    throw core::ServiceError(core::ServiceErrorKind::unknown_service, "no service " + service);
  }
  if (publisher_ == nullptr) {
    throw core::ServiceError(core::ServiceErrorKind::unsupported, "no publisher for " + channel_);
  }
  try {
    publisher_->publish(channel_, model::encode_signal(signal));
  } catch (const core::DeviceError& ex) {
    throw core::ServiceError(core::ServiceErrorKind::device, ex.what());
  }
}

TopicAsset::TopicAsset(AssetProfile profile, TopicOptions options, std::unique_ptr<bus::MessagePublisher> publisher,
                       bus::RedisEndpoint endpoint, const std::size_t mailbox_capacity,
                       std::vector<sinks::SignalSink*> sinks)
    : UnitAsset(std::move(profile),
                std::make_unique<TopicState>(options.service, options.channel, options.unit, std::move(publisher)),
                mailbox_capacity),
      options_(std::move(options)),
      sinks_(std::move(sinks)),
      subscriber_(std::move(endpoint), options_.channel,
                  [this](const std::string& payload, const std::stop_token& stop) { deliver(payload, stop); }) {}

TopicAsset::~TopicAsset() { TopicAsset::join(); }

void TopicAsset::start(std::stop_token stop) {
  UnitAsset::start(stop);
  subscriber_.start(std::move(stop));
}

void TopicAsset::join() {
  subscriber_.join();
  UnitAsset::join();
}

bool TopicAsset::deliver(const std::string& payload, const std::stop_token& stop) {
  model::Signal signal{};
  if (!model::decode_payload(payload, options_.unit, signal)) {
    std::cerr << "[topic] " << options_.channel << ": dropping undecodable payload\n";
    return false;
  }
  if (!owner().deliver(signal, stop)) {
    return false;
  }
  for (auto* sink : sinks_) {
    sink->publish(sinks::SignalRecord{name(), options_.service, signal});
  }
  return true;
}

}  // namespace asset_agent::assets
