#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <stratus/log.hpp>

namespace stratus::testing {

// Routes log records into memory for the lifetime of the object. Records are
// shared with the sink so a late delivery from another thread stays valid.
class LogCapture {
public:
  struct Record {
    LogLevel level;
    std::string tag;
    std::string message;
  };

  explicit LogCapture(LogLevel level = LogLevel::Debug) : saved_level_(log_level()) {
    set_log_level(level);
    set_log_sink([state = state_](LogLevel lvl, const char* tag, const char* msg) {
      std::lock_guard<std::mutex> lk(state->mu);
      state->records.push_back(Record{lvl, tag, msg});
    });
  }
  ~LogCapture() {
    set_log_sink({});
    set_log_level(saved_level_);
  }
  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  std::size_t count(LogLevel level, const std::string& tag) const {
    std::lock_guard<std::mutex> lk(state_->mu);
    std::size_t n = 0;
    for (const auto& r : state_->records) if (r.level == level && r.tag == tag) ++n;
    return n;
  }

  std::vector<Record> records() const {
    std::lock_guard<std::mutex> lk(state_->mu);
    return state_->records;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lk(state_->mu);
    for (const auto& r : state_->records) if (r.message.find(needle) != std::string::npos) return true;
    return false;
  }

private:
  struct State {
    std::mutex mu;
    std::vector<Record> records;
  };

  LogLevel saved_level_;
  std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace stratus::testing
