#include "bus/redis_connection.hpp"

#include <stdexcept>

#include <hiredis/hiredis.h>

namespace asset_agent::bus {
namespace {

bool run_setup_command(redisContext* context, const char* label, redisReply* reply, std::string& error) {
  if (reply == nullptr) {
    error = std::string(label) + " failed: " + (context->errstr[0] != '\0' ? context->errstr : "no reply");
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    error = std::string(label) + " rejected: " + (reply->str != nullptr ? reply->str : "unknown");
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace

void RedisContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

RedisEndpoint parse_redis_address(const std::string& address) {
  RedisEndpoint endpoint{};
  if (address.rfind("unix://", 0) == 0) {
    endpoint.unix_socket = address.substr(std::string("unix://").size());
    endpoint.host.clear();
    endpoint.port = 0;
    return endpoint;
  }

  if (!address.empty() && address.front() == '/') {
    endpoint.unix_socket = address;
    endpoint.host.clear();
    endpoint.port = 0;
    return endpoint;
  }

  const auto split = address.find(':');
  if (split == std::string::npos) {
    endpoint.host = address;
    return endpoint;
  }

  endpoint.host = address.substr(0, split);
  int parsed_port = 0;
  try {
    parsed_port = std::stoi(address.substr(split + 1));
  } catch (const std::exception&) {
    throw std::runtime_error("redis.address port is not a number: " + address);
  }
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }
  endpoint.port = static_cast<std::uint16_t>(parsed_port);
  return endpoint;
}

std::string describe(const RedisEndpoint& endpoint) {
  if (!endpoint.unix_socket.empty()) {
    return "unix://" + endpoint.unix_socket;
  }
  return endpoint.host + ':' + std::to_string(endpoint.port);
}

RedisContextPtr connect_redis(const RedisEndpoint& endpoint, std::string& error) {
  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(endpoint.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((endpoint.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!endpoint.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(endpoint.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(endpoint.host.c_str(), static_cast<int>(endpoint.port), timeout);
  }
  if (raw == nullptr) {
    error = "connect failed: out of memory";
    return nullptr;
  }

  RedisContextPtr context(raw);
  if (context->err != REDIS_OK) {
    error = std::string("connect failed: ") + context->errstr;
    return nullptr;
  }

  if (!endpoint.password.empty() &&
      !run_setup_command(context.get(), "AUTH",
                         static_cast<redisReply*>(redisCommand(context.get(), "AUTH %s", endpoint.password.c_str())),
                         error)) {
    return nullptr;
  }

  if (endpoint.db != 0 &&
      !run_setup_command(context.get(), "SELECT",
                         static_cast<redisReply*>(redisCommand(context.get(), "SELECT %d", endpoint.db)), error)) {
    return nullptr;
  }

  return context;
}

}  // namespace asset_agent::bus
