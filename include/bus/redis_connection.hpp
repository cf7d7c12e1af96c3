#pragma once

#include <cstdint>
#include <memory>
#include <string>

struct redisContext;

namespace asset_agent::bus {

struct RedisEndpoint {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::uint32_t connect_timeout_ms{1000};
};

struct RedisContextDeleter {
  void operator()(redisContext* context) const;
};

using RedisContextPtr = std::unique_ptr<redisContext, RedisContextDeleter>;

// Accepts "host", "host:port", "unix:///path" and "/path". Throws std::runtime_error.
RedisEndpoint parse_redis_address(const std::string& address);

std::string describe(const RedisEndpoint& endpoint);

// Connects, authenticates and selects the database. Returns null with error set on failure.
RedisContextPtr connect_redis(const RedisEndpoint& endpoint, std::string& error);

}  // namespace asset_agent::bus
