#include "sinks/historian.hpp"

#include <iostream>
#include <utility>
#include <vector>

namespace asset_agent::sinks {

Historian::Historian(RedisTsOptions options, const std::size_t queue_capacity)
    : writer_(std::move(options)), queue_(queue_capacity) {}

Historian::~Historian() { join(); }

void Historian::publish(const SignalRecord& record) {
  SignalRecord copy = record;
  if (queue_.try_push(std::move(copy)) != core::MailboxStatus::accepted) {
    ++dropped_;
  }
}

void Historian::start(std::stop_token stop) {
  if (thread_.joinable()) {
    return;
  }
  if (writer_.check_connectivity()) {
    std::cerr << "[redis] historian connected\n";
  } else {
    std::cerr << "[redis] historian connectivity check failed; will retry per batch\n";
  }
  thread_ = std::thread([this, stop = std::move(stop)] { run(stop); });
}

void Historian::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Historian::flush_once(const std::stop_token& stop) {
  std::vector<SignalRecord> batch;
  auto first = queue_.pop(stop);
  if (!first) {
    return true;
  }
  batch.push_back(std::move(*first));
  while (batch.size() < kHistorianBatchSize) {
    auto next = queue_.try_pop();
    if (!next) {
      break;
    }
    batch.push_back(std::move(*next));
  }

  const bool ok = writer_.publish(batch);
  if (!ok) {
    if (redis_was_ok_) {
      std::cerr << "[redis] publish failed; dropping " << batch.size() << " samples until recovery\n";
      redis_was_ok_ = false;
    }
    return false;
  }
  if (!redis_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    redis_was_ok_ = true;
  }
  written_ += batch.size();
  return true;
}

std::uint64_t Historian::dropped() const noexcept { return dropped_.load(); }

std::uint64_t Historian::written() const noexcept { return written_.load(); }

void Historian::run(const std::stop_token stop) {
  while (!stop.stop_requested()) {
    flush_once(stop);
  }
  queue_.close();
  std::cerr << "[redis] historian stopped (" << written_.load() << " written, " << dropped_.load()
            << " dropped)\n";
}

}  // namespace asset_agent::sinks
