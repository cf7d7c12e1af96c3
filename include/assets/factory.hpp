#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "assets/unit_asset.hpp"
#include "bus/redis_connection.hpp"
#include "core/config.hpp"
#include "sensors/w1_thermometer.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::assets {

struct AssetContext {
  std::size_t mailbox_capacity{core::kDefaultMailboxCapacity};
  std::chrono::milliseconds request_timeout{5000};
  std::vector<sinks::SignalSink*> sinks{};
  // Bus used by topic assets without their own broker trait.
  std::optional<bus::RedisEndpoint> redis{};
  std::string w1_device_root{sensors::kW1DeviceRoot};
};

// Services a kind offers when the configuration names none.
std::vector<model::ServiceDefinition> default_services(const std::string& kind);

// Builds an unstarted asset. Throws std::runtime_error for invalid traits or services.
std::unique_ptr<UnitAsset> make_asset(const core::AssetConfig& config, const AssetContext& context);

}  // namespace asset_agent::assets
