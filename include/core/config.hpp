#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/service.hpp"

namespace asset_agent::core {

struct RedisConfig {
  std::string address{};
  std::string password{};
  int db{0};
  std::string key_prefix{"assets"};
  bool enabled{false};
};

struct HttpConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{20150};
  std::size_t workers{4};
};

struct AssetConfig {
  std::string name{};
  std::string kind{};
  model::Details details{};
  // Empty means the kind's default services.
  std::vector<model::ServiceDefinition> services{};
  std::vector<model::ConsumedService> consumes{};
  nlohmann::json traits = nlohmann::json::object();
};

struct SystemConfig {
  std::string system{};
  HttpConfig http{};
  std::chrono::milliseconds request_timeout{5000};
  std::chrono::milliseconds shutdown_grace{2000};
  std::size_t mailbox_capacity{16};
  bool stdout_debug{false};
  RedisConfig redis{};
  std::vector<AssetConfig> assets{};
};

// Both throw std::runtime_error naming the offending key.
SystemConfig load_system_config(const std::string& path);
SystemConfig parse_system_config(const nlohmann::json& document);

}  // namespace asset_agent::core
