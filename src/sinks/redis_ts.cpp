#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

namespace asset_agent::sinks {

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsSink::~RedisTsSink() = default;

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

std::string RedisTsSink::key_for(const SignalRecord& record) const {
  return options_.key_prefix + ":" + record.asset + ":" + record.service;
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  std::string error;
  context_ = bus::connect_redis(options_.endpoint, error);
  if (context_ == nullptr) {
    std::cerr << "[redis] " << error << '\n';
    return false;
  }
  return true;
}

bool RedisTsSink::ensure_key(const std::string& key) {
  if (created_keys_.count(key) != 0) {
    return true;
  }

  redisReply* reply =
      static_cast<redisReply*>(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
  if (reply == nullptr) {
    return false;
  }

  const bool already_exists =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
  const bool unknown_command =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
  const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
  const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
  freeReplyObject(reply);

  if (unknown_command) {
    std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
    timeseries_available_ = false;
    return false;
  }
  if (!ok) {
    std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
    return false;
  }

  created_keys_.insert(key);
  return true;
}

bool RedisTsSink::publish(const std::vector<SignalRecord>& batch) {
  if (batch.empty()) {
    return true;
  }
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(batch)) {
    return true;
  }

  if (!timeseries_available_ || !reconnect()) {
    return false;
  }
  return publish_impl(batch);
}

bool RedisTsSink::publish_impl(const std::vector<SignalRecord>& batch) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.reserve(1 + (batch.size() * 3));
  command_args_.emplace_back("TS.MADD");

  for (const SignalRecord& record : batch) {
    if (!std::isfinite(record.signal.value)) {
      continue;
    }
    const std::string key = key_for(record);
    if (!ensure_key(key)) {
      return false;
    }
    command_args_.push_back(key);
    command_args_.push_back(std::to_string(core::unix_timestamp_ms(record.signal.timestamp)));
    command_args_.push_back(std::to_string(record.signal.value));
  }

  if (command_args_.size() == 1) {
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace asset_agent::sinks
