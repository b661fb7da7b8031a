#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <stratus/latest_value.hpp>
#include <stratus/ollama.hpp>

namespace stratus {

struct WarmupConfig {
  std::string model = "llama3.2:3b";
  std::chrono::milliseconds interval{30000};
  std::string endpoint = "http://localhost:11434";
};

struct HeartbeatStats {
  std::uint64_t count = 0;
  std::uint64_t last_latency_ms = 0;
  bool is_running = false;
  bool is_paused = false;
  bool is_held = false;
};

// Keeps the model resident by sending a tiny generation request every
// interval. Owns its worker thread; ping failures are logged, never thrown.
class WarmupHeartbeat {
public:
  static constexpr const char* kPingPrompt = "Ready";
  static constexpr std::chrono::milliseconds kPingTimeout{15000};

  // Talks HTTP to config.endpoint. Throws Error(EndpointUnavailable) for an
  // unusable endpoint url.
  explicit WarmupHeartbeat(WarmupConfig config);
  WarmupHeartbeat(WarmupConfig config, std::shared_ptr<LlmTransport> transport);
  ~WarmupHeartbeat();
  WarmupHeartbeat(const WarmupHeartbeat&) = delete;
  WarmupHeartbeat& operator=(const WarmupHeartbeat&) = delete;

  void start();   // warns and returns if already running
  void stop();    // lets an in-flight ping finish, then joins the worker
  void pause();   // honored at the next cycle boundary
  void resume();

  // Suppresses cycles while any hold is outstanding, independently of
  // pause(); used for the duration of a transmission. Calls nest.
  void hold();
  void release();

  // One ping right now, regardless of pause state. Does not bump the counter.
  std::uint64_t force_ping();

  // One cycle body without the interval wait. Returns true if a ping was sent.
  bool run_cycle();

  const LatestValue<HeartbeatStats>& stats() const { return stats_; }
  bool is_running() const;
  bool is_paused() const;
  bool is_held() const;
  const WarmupConfig& config() const { return config_; }

private:
  enum class State { Stopped, Running, Stopping };

  void thread_main_();
  std::uint64_t send_ping_();
  void publish_locked_();

  WarmupConfig config_;
  OllamaClient client_;

  mutable std::mutex mu_;
  std::condition_variable wake_;
  State state_{State::Stopped};
  bool paused_{false};
  int holds_{0};
  std::uint64_t count_{0};
  std::uint64_t last_latency_ms_{0};

  LatestValue<HeartbeatStats> stats_;
  std::thread th_;
};

} // namespace stratus
