#include <stratus/session.hpp>
#include <stratus/error.hpp>
#include <stratus/http.hpp>
#include <stratus/log.hpp>
#include <utility>

namespace stratus {

static constexpr const char* kTag = "session";

static std::filesystem::path resolve_data_dir(const AppConfig& cfg) {
  if (cfg.data_dir.empty()) return TelemetryStore::default_data_dir();
  return std::filesystem::path(cfg.data_dir);
}

namespace {

// Holds the heartbeat for one transmission. The user's pause flag is not
// touched, so pause/resume during the transmission take effect afterwards.
class HeartbeatHold {
public:
  explicit HeartbeatHold(WarmupHeartbeat& hb) : hb_(hb) { hb_.hold(); }
  ~HeartbeatHold() { hb_.release(); }
  HeartbeatHold(const HeartbeatHold&) = delete;
  HeartbeatHold& operator=(const HeartbeatHold&) = delete;

private:
  WarmupHeartbeat& hb_;
};

} // namespace

AtcSession::AtcSession(AppConfig config)
  : AtcSession(config, make_http_transport(config.endpoint)) {}

AtcSession::AtcSession(AppConfig config, std::shared_ptr<LlmTransport> transport)
  : config_(std::move(config)),
    transport_(std::move(transport)),
    generator_(OllamaClient(transport_, config_.model), stream_config(config_)),
    engine_(engine_config(config_), generator_),
    heartbeat_(warmup_config(config_), transport_),
    store_(resolve_data_dir(config_)) {
  STRATUS_LOG_INFO(kTag, "model %s at %s, telemetry from %s",
                   config_.model.c_str(), config_.endpoint.c_str(),
                   store_.file_path().string().c_str());

  // Pick up a file written before we started watching.
  try {
    last_telemetry_ = store_.read();
    last_received_ = std::chrono::steady_clock::now();
  } catch (const Error& e) {
    STRATUS_LOG_DEBUG(kTag, "no initial telemetry: %s", e.what());
  }
}

void AtcSession::start() {
  if (!config_.warmup_enabled) {
    STRATUS_LOG_INFO(kTag, "warmup disabled");
    return;
  }
  heartbeat_.start();
}

void AtcSession::stop() {
  heartbeat_.stop();
}

std::optional<TelemetrySnapshot> AtcSession::poll_telemetry() {
  std::optional<TelemetrySnapshot> snap;
  try {
    snap = store_.poll();
  } catch (const Error& e) {
    STRATUS_LOG_WARN(kTag, "telemetry: %s", e.what());
    return std::nullopt;
  }
  if (!snap) return std::nullopt;

  std::lock_guard<std::mutex> lk(telemetry_mu_);
  last_telemetry_ = *snap;
  last_received_ = std::chrono::steady_clock::now();
  return snap;
}

std::optional<TelemetrySnapshot> AtcSession::telemetry() const {
  std::lock_guard<std::mutex> lk(telemetry_mu_);
  return last_telemetry_;
}

bool AtcSession::telemetry_fresh(std::chrono::milliseconds max_age) const {
  std::lock_guard<std::mutex> lk(telemetry_mu_);
  if (!last_telemetry_) return false;
  return std::chrono::steady_clock::now() - last_received_ <= max_age;
}

TelemetrySnapshot AtcSession::current_telemetry_() const {
  if (auto t = telemetry()) return *t;
  STRATUS_LOG_DEBUG(kTag, "no telemetry yet, prompting with an empty snapshot");
  return TelemetrySnapshot{};
}

std::string AtcSession::transmit(const std::string& pilot_text, const ChunkCallback& on_chunk) {
  std::lock_guard<std::mutex> lk(transmit_mu_);
  HeartbeatHold hold(heartbeat_);
  return engine_.process(pilot_text, current_telemetry_(), on_chunk);
}

std::string AtcSession::retry(const ChunkCallback& on_chunk) {
  std::lock_guard<std::mutex> lk(transmit_mu_);
  HeartbeatHold hold(heartbeat_);
  return engine_.retry(current_telemetry_(), on_chunk);
}

bool AtcSession::model_available() const {
  return generator_.is_available();
}

std::vector<ConversationEntry> AtcSession::history() const {
  std::lock_guard<std::mutex> lk(transmit_mu_);
  const auto& entries = engine_.history().entries();
  return std::vector<ConversationEntry>(entries.begin(), entries.end());
}

} // namespace stratus
