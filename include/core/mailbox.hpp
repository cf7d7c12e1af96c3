#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace asset_agent::core {

enum class MailboxStatus : std::uint8_t {
  accepted = 0,
  timed_out = 1,
  cancelled = 2,
  closed = 3,
};

// Bounded multi-producer single-consumer queue. Every blocking call observes a stop token.
// Once closed, pending items are destroyed and further pushes are refused.
template <typename T>
class Mailbox {
 public:
  explicit Mailbox(const std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  MailboxStatus push(T item, const std::stop_token& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_full_.wait(lock, stop, [this] { return closed_ || queue_.size() < capacity_; })) {
      return MailboxStatus::cancelled;
    }
    return enqueue(lock, std::move(item));
  }

  template <typename Clock, typename Duration>
  MailboxStatus push_until(T item, const std::chrono::time_point<Clock, Duration>& deadline,
                           const std::stop_token& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_full_.wait_until(lock, stop, deadline, [this] { return closed_ || queue_.size() < capacity_; })) {
      return stop.stop_requested() ? MailboxStatus::cancelled : MailboxStatus::timed_out;
    }
    return enqueue(lock, std::move(item));
  }

  // Leaves item untouched unless it was accepted.
  MailboxStatus try_push(T&& item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!closed_ && queue_.size() >= capacity_) {
      return MailboxStatus::timed_out;
    }
    return enqueue(lock, std::move(item));
  }

  // Returns nothing once stop is requested or the mailbox is closed and empty.
  std::optional<T> pop(const std::stop_token& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait(lock, stop, [this] { return closed_ || !queue_.empty(); })) {
      return std::nullopt;
    }
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  std::optional<T> try_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T item = std::move(queue_.front());
    queue_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void close() {
    std::deque<T> dropped;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      dropped.swap(queue_);
    }
    not_full_.notify_all();
    not_empty_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

 private:
  MailboxStatus enqueue(std::unique_lock<std::mutex>& lock, T&& item) {
    if (closed_) {
      return MailboxStatus::closed;
    }
    queue_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return MailboxStatus::accepted;
  }

  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable_any not_full_;
  std::condition_variable_any not_empty_;
  std::deque<T> queue_;
  bool closed_{false};
};

const char* to_string(MailboxStatus status) noexcept;

}  // namespace asset_agent::core
