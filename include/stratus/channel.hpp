#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace stratus {

enum class ChannelEnd {
  Open,       // sender still active
  Complete,   // sender finished normally
  Aborted     // sender stopped early
};

// Ordered bounded queue between one producer and one consumer.
// send() blocks while the queue is full and fails once the consumer has
// closed its side; receive() drains remaining items after the producer closes.
template <class T>
class BoundedChannel {
public:
  explicit BoundedChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool send(T value) {
    std::unique_lock<std::mutex> lock(mu_);
    not_full_.wait(lock, [this]{ return receiver_closed_ || items_.size() < capacity_; });
    if (receiver_closed_ || end_ != ChannelEnd::Open) return false;
    items_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool receive(T& out) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, [this]{ return !items_.empty() || end_ != ChannelEnd::Open; });
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  // Non-blocking receive; false if nothing is queued right now.
  bool try_receive(T& out) {
    std::unique_lock<std::mutex> lock(mu_);
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  // Producer side: no more items will follow.
  void close(ChannelEnd how = ChannelEnd::Complete) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (end_ == ChannelEnd::Open) end_ = (how == ChannelEnd::Open ? ChannelEnd::Complete : how);
    }
    not_empty_.notify_all();
  }

  // Consumer side: pending and future items are discarded.
  void close_receiver() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      receiver_closed_ = true;
      items_.clear();
    }
    not_full_.notify_all();
  }

  ChannelEnd end_state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return end_;
  }

  bool receiver_closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return receiver_closed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  ChannelEnd end_{ChannelEnd::Open};
  bool receiver_closed_{false};
};

} // namespace stratus
