#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "bus/redis_connection.hpp"
#include "sinks/signal_sink.hpp"

namespace asset_agent::sinks {

struct RedisTsOptions {
  bus::RedisEndpoint endpoint{};
  std::string key_prefix{"assets"};
};

// Synchronous RedisTimeSeries writer. Keys are <prefix>:<asset>:<service>, created on first use.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;

  bool check_connectivity();
  bool publish(const std::vector<SignalRecord>& batch);

  [[nodiscard]] std::string key_for(const SignalRecord& record) const;

 private:
  bool ensure_connected();
  bool reconnect();
  bool ensure_key(const std::string& key);
  bool publish_impl(const std::vector<SignalRecord>& batch);

  RedisTsOptions options_;
  bus::RedisContextPtr context_{};
  std::unordered_set<std::string> created_keys_{};
  std::vector<std::string> command_args_{};
  std::vector<const char*> command_argv_{};
  std::vector<std::size_t> command_argv_len_{};
  bool timeseries_available_{true};
};

}  // namespace asset_agent::sinks
