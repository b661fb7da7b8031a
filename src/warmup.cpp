#include <stratus/warmup.hpp>
#include <stratus/error.hpp>
#include <stratus/http.hpp>
#include <stratus/log.hpp>

namespace stratus {

static constexpr const char* kTag = "warmup";

WarmupHeartbeat::WarmupHeartbeat(WarmupConfig config)
  : WarmupHeartbeat(config, make_http_transport(config.endpoint)) {}

WarmupHeartbeat::WarmupHeartbeat(WarmupConfig config, std::shared_ptr<LlmTransport> transport)
  : config_(std::move(config)), client_(std::move(transport), config_.model) {
  std::lock_guard<std::mutex> lock(mu_);
  publish_locked_();
}

WarmupHeartbeat::~WarmupHeartbeat() { stop(); }

void WarmupHeartbeat::start() {
  std::unique_lock<std::mutex> lock(mu_);
  if (state_ != State::Stopped) {
    STRATUS_LOG_WARN(kTag, "warmup heartbeat already running");
    return;
  }
  state_ = State::Running;
  publish_locked_();
  th_ = std::thread(&WarmupHeartbeat::thread_main_, this);
  lock.unlock();

  STRATUS_LOG_INFO(kTag, "started: model=%s interval=%llds endpoint=%s",
                   config_.model.c_str(),
                   static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(config_.interval).count()),
                   config_.endpoint.c_str());
}

void WarmupHeartbeat::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ != State::Running) return;
    state_ = State::Stopping;
  }
  wake_.notify_all();
  if (th_.joinable()) th_.join();

  std::lock_guard<std::mutex> lock(mu_);
  state_ = State::Stopped;
  publish_locked_();
  STRATUS_LOG_INFO(kTag, "stopped after %llu heartbeats", static_cast<unsigned long long>(count_));
}

void WarmupHeartbeat::pause() {
  std::lock_guard<std::mutex> lock(mu_);
  if (paused_) return;
  paused_ = true;
  publish_locked_();
  STRATUS_LOG_DEBUG(kTag, "paused");
}

void WarmupHeartbeat::resume() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!paused_) return;
  paused_ = false;
  publish_locked_();
  STRATUS_LOG_DEBUG(kTag, "resumed");
}

void WarmupHeartbeat::hold() {
  std::lock_guard<std::mutex> lock(mu_);
  if (holds_++ == 0) publish_locked_();
}

void WarmupHeartbeat::release() {
  std::lock_guard<std::mutex> lock(mu_);
  if (holds_ == 0) {
    STRATUS_LOG_WARN(kTag, "release without a matching hold");
    return;
  }
  if (--holds_ == 0) publish_locked_();
}

bool WarmupHeartbeat::is_running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == State::Running;
}

bool WarmupHeartbeat::is_paused() const {
  std::lock_guard<std::mutex> lock(mu_);
  return paused_;
}

bool WarmupHeartbeat::is_held() const {
  std::lock_guard<std::mutex> lock(mu_);
  return holds_ > 0;
}

std::uint64_t WarmupHeartbeat::force_ping() {
  const auto latency = send_ping_();
  STRATUS_LOG_INFO(kTag, "forced warmup complete: %llu ms", static_cast<unsigned long long>(latency));
  return latency;
}

bool WarmupHeartbeat::run_cycle() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (paused_ || holds_ > 0) {
      STRATUS_LOG_DEBUG(kTag, "%s, skipping heartbeat", paused_ ? "paused" : "held");
      return false;
    }
  }

  // The request runs unlocked so pause/stop never wait on the network.
  const auto latency = send_ping_();

  std::lock_guard<std::mutex> lock(mu_);
  ++count_;
  last_latency_ms_ = latency;
  publish_locked_();
  STRATUS_LOG_DEBUG(kTag, "heartbeat %llu: %llu ms",
                    static_cast<unsigned long long>(count_),
                    static_cast<unsigned long long>(latency));
  return true;
}

void WarmupHeartbeat::thread_main_() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      wake_.wait_for(lock, config_.interval, [this]{ return state_ != State::Running; });
      if (state_ != State::Running) break;
    }
    run_cycle();
  }
}

std::uint64_t WarmupHeartbeat::send_ping_() {
  using clock = std::chrono::steady_clock;
  const auto start = clock::now();
  const GenerateOptions options{0.0, 5};
  try {
    (void)client_.generate(kPingPrompt, options, kPingTimeout);
  } catch (const Error& e) {
    STRATUS_LOG_WARN(kTag, "warmup ping failed: %s", e.what());
  }
  return static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start).count());
}

void WarmupHeartbeat::publish_locked_() {
  HeartbeatStats s;
  s.count = count_;
  s.last_latency_ms = last_latency_ms_;
  s.is_running = (state_ == State::Running);
  s.is_paused = paused_;
  s.is_held = holds_ > 0;
  stats_.publish(s);
}

} // namespace stratus
