#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace stratus {

// Single-writer multi-reader latest-only value cell.
// Every publish replaces the whole value; readers keep their own cursor and
// never block the writer for longer than a copy.
template <class T>
class LatestValue {
public:
  LatestValue() = default;
  explicit LatestValue(const T& initial) { publish(initial); }

  void publish(const T& v) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      data_ = v;
      ++seq_;
    }
    cv_.notify_all();
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (seq_ == cursor) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  // Blocks until the sequence moves past cursor or the timeout expires.
  bool wait_next(std::uint64_t& cursor, T& out, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, timeout, [&]{ return seq_ != cursor; })) return false;
    out = data_;
    cursor = seq_;
    return true;
  }

  T get() const {
    std::lock_guard<std::mutex> lock(mu_);
    return data_;
  }

  std::uint64_t sequence() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seq_;
  }

  // Reader handle. A fresh subscription first yields the current value (if
  // anything was ever published), then live updates. Must not outlive the cell.
  class Subscription {
  public:
    explicit Subscription(const LatestValue& src) : src_(&src) {}
    bool poll(T& out) { return src_->try_consume_latest(cursor_, out); }
    bool wait(T& out, std::chrono::milliseconds timeout) { return src_->wait_next(cursor_, out, timeout); }
  private:
    const LatestValue* src_;
    std::uint64_t cursor_{0};
  };

  Subscription subscribe() const { return Subscription(*this); }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  T data_{};
  std::uint64_t seq_{0};
};

} // namespace stratus
