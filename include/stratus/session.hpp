#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <stratus/config.hpp>
#include <stratus/conversation.hpp>
#include <stratus/llm_transport.hpp>
#include <stratus/streaming.hpp>
#include <stratus/telemetry_store.hpp>
#include <stratus/warmup.hpp>

namespace stratus {

// Owns the model connection, the heartbeat and the telemetry watch, and runs
// one transmission at a time.
class AtcSession {
public:
  // Throws Error(EndpointUnavailable) for a bad endpoint url and
  // Error(WatchSetup) if the data directory cannot be watched.
  explicit AtcSession(AppConfig config);
  AtcSession(AppConfig config, std::shared_ptr<LlmTransport> transport);
  ~AtcSession() { stop(); }
  AtcSession(const AtcSession&) = delete;
  AtcSession& operator=(const AtcSession&) = delete;

  void start();  // starts the heartbeat if enabled
  void stop();

  // Call from one thread. Returns the new snapshot if one was read.
  std::optional<TelemetrySnapshot> poll_telemetry();
  std::optional<TelemetrySnapshot> telemetry() const;
  bool telemetry_fresh(std::chrono::milliseconds max_age) const;

  // Blocks until any other transmission finished. Errors propagate.
  std::string transmit(const std::string& pilot_text, const ChunkCallback& on_chunk = {});
  std::string retry(const ChunkCallback& on_chunk = {});

  bool model_available() const;

  WarmupHeartbeat& heartbeat() { return heartbeat_; }
  const WarmupHeartbeat& heartbeat() const { return heartbeat_; }

  // Copy of the transcript; waits for a transmission in flight.
  std::vector<ConversationEntry> history() const;

  const AppConfig& config() const { return config_; }
  const TelemetryStore& store() const { return store_; }

private:
  TelemetrySnapshot current_telemetry_() const;

  AppConfig config_;
  std::shared_ptr<LlmTransport> transport_;
  StreamingGenerator generator_;
  ConversationEngine engine_;
  WarmupHeartbeat heartbeat_;
  TelemetryStore store_;

  mutable std::mutex transmit_mu_;

  mutable std::mutex telemetry_mu_;
  std::optional<TelemetrySnapshot> last_telemetry_;
  std::chrono::steady_clock::time_point last_received_{};
};

} // namespace stratus
