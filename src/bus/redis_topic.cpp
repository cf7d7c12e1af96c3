#include "bus/redis_topic.hpp"

#include <sys/socket.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <utility>

#include <hiredis/hiredis.h>

#include "core/cancellation.hpp"
#include "core/errors.hpp"

namespace asset_agent::bus {
namespace {

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

bool element_is(const redisReply* element, const char* text) {
  return element != nullptr && (element->type == REDIS_REPLY_STRING || element->type == REDIS_REPLY_STATUS) &&
         element->str != nullptr && std::strcmp(element->str, text) == 0;
}

}  // namespace

RedisPublisher::RedisPublisher(RedisEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

void RedisPublisher::publish(const std::string& channel, const std::string& payload) {
  std::string error;
  if (try_publish(channel, payload, error)) {
    return;
  }
  // One reconnect per publish; a stale connection is the common failure.
  context_.reset();
  if (!try_publish(channel, payload, error)) {
    throw core::DeviceError("publish to " + channel + " failed: " + error);
  }
}

bool RedisPublisher::try_publish(const std::string& channel, const std::string& payload, std::string& error) {
  if (context_ == nullptr || context_->err != REDIS_OK) {
    context_ = connect_redis(endpoint_, error);
    if (context_ == nullptr) {
      return false;
    }
  }

  ReplyPtr reply(static_cast<redisReply*>(
      redisCommand(context_.get(), "PUBLISH %b %b", channel.data(), channel.size(), payload.data(), payload.size())));
  if (reply == nullptr) {
    error = context_->errstr;
    return false;
  }
  if (reply->type == REDIS_REPLY_ERROR) {
    error = reply->str != nullptr ? reply->str : "error reply";
    return false;
  }
  return true;
}

TopicSubscriber::TopicSubscriber(RedisEndpoint endpoint, std::string channel, MessageHandler on_message,
                                 const std::chrono::milliseconds retry_delay)
    : endpoint_(std::move(endpoint)),
      channel_(std::move(channel)),
      on_message_(std::move(on_message)),
      retry_delay_(retry_delay) {}

TopicSubscriber::~TopicSubscriber() { join(); }

void TopicSubscriber::start(std::stop_token stop) {
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::thread([this, stop = std::move(stop)] { run(stop); });
}

void TopicSubscriber::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

const std::string& TopicSubscriber::channel() const noexcept { return channel_; }

std::uint64_t TopicSubscriber::received() const noexcept { return received_.load(); }

void TopicSubscriber::run(const std::stop_token stop) {
  bool bus_was_ok = true;

  while (!stop.stop_requested()) {
    std::string error;
    RedisContextPtr context = connect_redis(endpoint_, error);
    // Subscriptions block indefinitely; shutdown() below is what ends a read.
    if (context != nullptr && redisSetTimeout(context.get(), timeval{0, 0}) != REDIS_OK) {
      error = "cannot clear read timeout";
      context.reset();
    }
    if (context != nullptr) {
      active_fd_.store(context->fd);
      {
        std::stop_callback on_stop(stop, [this] {
          const int fd = active_fd_.load();
          if (fd >= 0) {
            ::shutdown(fd, SHUT_RDWR);
          }
        });
        if (!stop.stop_requested() && listen(context.get(), stop, error)) {
          bus_was_ok = true;
        }
      }
      active_fd_.store(-1);
    }

    if (stop.stop_requested()) {
      break;
    }
    if (bus_was_ok) {
      std::cerr << "[topic] " << channel_ << " lost (" << describe(endpoint_) << "): " << error << '\n';
      bus_was_ok = false;
    }
    core::sleep_for(stop, retry_delay_);
  }

  std::cerr << "[topic] " << channel_ << " unsubscribed\n";
}

// Returns true once the subscription was confirmed, whatever ended it afterwards.
bool TopicSubscriber::listen(redisContext* context, const std::stop_token& stop, std::string& error) {
  ReplyPtr confirmation(
      static_cast<redisReply*>(redisCommand(context, "SUBSCRIBE %b", channel_.data(), channel_.size())));
  if (confirmation == nullptr || confirmation->type == REDIS_REPLY_ERROR) {
    error = confirmation == nullptr ? context->errstr : "SUBSCRIBE rejected";
    return false;
  }
  std::cerr << "[topic] subscribed to " << channel_ << '\n';

  while (!stop.stop_requested()) {
    void* raw = nullptr;
    if (redisGetReply(context, &raw) != REDIS_OK) {
      error = context->errstr;
      return true;
    }
    ReplyPtr reply(static_cast<redisReply*>(raw));
    if (reply == nullptr || reply->type != REDIS_REPLY_ARRAY || reply->elements < 3 ||
        !element_is(reply->element[0], "message")) {
      continue;
    }

    const redisReply* payload = reply->element[2];
    if (payload == nullptr || payload->str == nullptr) {
      continue;
    }
    ++received_;
    on_message_(std::string(payload->str, payload->len), stop);
  }
  return true;
}

}  // namespace asset_agent::bus
