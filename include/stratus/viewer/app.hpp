#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <stratus/channel.hpp>
#include <stratus/latest_value.hpp>
#include <stratus/telemetry.hpp>
#include <stratus/warmup.hpp>

namespace stratus {

class AtcSession;

// RAII window showing live telemetry, heartbeat status and the radio log.
// Transmissions and endpoint probes run on worker threads; the render loop
// only drains their results.
class ViewerApp {
public:
  explicit ViewerApp(AtcSession& session);
  ~ViewerApp();
  ViewerApp(const ViewerApp&) = delete;
  ViewerApp& operator=(const ViewerApp&) = delete;

  int run(); // returns 0 on normal exit

private:
  enum class ModelStatus : int { Unknown = 0, Ready, Offline };

  struct UiEvent {
    enum class Kind { Chunk, Done, Failed } kind = Kind::Chunk;
    std::string text;
    std::uint64_t latency_ms = 0;
  };

  struct LogLine {
    bool pilot = false;
    std::string text;
    std::string note;  // latency or error
    bool error = false;
  };

  // Input & data flow
  void process_input_();
  void pump_telemetry_();
  void pump_events_();
  void submit_(std::string text, bool is_retry);
  void join_transmit_();

  // Workers
  void transmit_main_(std::string text, bool is_retry);
  void probe_main_();

  // Rendering
  void render_frame_();
  void draw_header_();
  void draw_telemetry_panel_();
  void draw_comm_log_();
  void draw_input_();

  // Dependencies
  AtcSession& session_;

  // Telemetry & heartbeat
  std::optional<TelemetrySnapshot> telemetry_;
  HeartbeatStats hb_stats_{};
  LatestValue<HeartbeatStats>::Subscription hb_sub_;
  std::chrono::steady_clock::time_point next_poll_{};

  // Transmit worker
  BoundedChannel<UiEvent> events_{256};
  std::thread transmit_th_;
  std::atomic<bool> busy_{false};

  // Probe worker
  std::thread probe_th_;
  std::mutex probe_mu_;
  std::condition_variable probe_wake_;
  bool closing_{false};
  std::atomic<int> model_status_{static_cast<int>(ModelStatus::Unknown)};

  // UI state
  std::deque<LogLine> log_;
  std::string input_;
  bool streaming_line_open_{false};
};

} // namespace stratus
