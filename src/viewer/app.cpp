#include <raylib.h>
#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

#include <stratus/viewer/app.hpp>
#include <stratus/conversation.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <stratus/session.hpp>

namespace stratus {

namespace {

static constexpr const char* kTag = "viewer";

static constexpr auto kTelemetryPollEvery = std::chrono::milliseconds(100);
static constexpr auto kTelemetryFreshFor  = std::chrono::milliseconds(5000);
static constexpr auto kProbeEvery         = std::chrono::seconds(10);
static constexpr std::size_t kMaxLogLines = 200;
static constexpr std::size_t kMaxInput    = 160;

// --- Layout (keep in sync with the draw_* functions) ---
static constexpr int kHeaderH   = 64;
static constexpr int kPanelW    = 300;
static constexpr int kInputH    = 44;
static constexpr int kPad       = 12;
static constexpr int kLineH     = 20;

static const Color kBg        {18, 22, 30, 255};
static const Color kPanel     {28, 32, 42, 230};
static const Color kText      {220, 225, 235, 255};
static const Color kDim       {150, 160, 175, 255};
static const Color kPilotCol  {120, 190, 255, 255};
static const Color kAtcCol    {120, 230, 150, 255};
static const Color kErrorCol  {235, 110, 100, 255};
static const Color kWarnCol   {240, 200, 90, 255};

static void fmt_freq(std::int32_t hz, char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  if (hz <= 0) { std::snprintf(out, (size_t)cap, "%s", "---.---"); return; }
  std::snprintf(out, (size_t)cap, "%.3f", hz / 1e6);
}

// Greedy word wrap by measured pixel width.
static std::vector<std::string> wrap_text(const std::string& text, int font, int max_w) {
  std::vector<std::string> lines;
  std::string cur;
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t j = text.find(' ', i);
    if (j == std::string::npos) j = text.size();
    const std::string word = text.substr(i, j - i);
    const std::string cand = cur.empty() ? word : cur + " " + word;
    if (!cur.empty() && MeasureText(cand.c_str(), font) > max_w) {
      lines.push_back(cur);
      cur = word;
    } else {
      cur = cand;
    }
    i = j + 1;
  }
  if (!cur.empty() || lines.empty()) lines.push_back(cur);
  return lines;
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(AtcSession& session)
  : session_(session),
    hb_sub_(session.heartbeat().stats().subscribe()) {
  probe_th_ = std::thread(&ViewerApp::probe_main_, this);
}

ViewerApp::~ViewerApp() {
  {
    std::lock_guard<std::mutex> lk(probe_mu_);
    closing_ = true;
  }
  probe_wake_.notify_all();
  if (probe_th_.joinable()) probe_th_.join();

  // The worker keeps generating until the reply ends; its sends just fail.
  events_.close_receiver();
  join_transmit_();
}

int ViewerApp::run() {
  const int W = 1100, H = 720;
  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(W, H, "Stratus ATC");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_telemetry_();
    pump_events_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  for (int c = GetCharPressed(); c > 0; c = GetCharPressed()) {
    if (c >= 32 && c < 127 && input_.size() < kMaxInput) input_.push_back(static_cast<char>(c));
  }
  if (IsKeyPressed(KEY_BACKSPACE) && !input_.empty()) {
    input_.pop_back();
  }
  if (IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER)) {
    std::string text = trim_copy(input_);
    if (!text.empty() && !busy_.load()) {
      input_.clear();
      submit_(std::move(text), false);
    }
  }

  // F5: regenerate the last unanswered reply
  if (IsKeyPressed(KEY_F5) && !busy_.load()) submit_(std::string(), true);

  // F2: heartbeat pause toggle
  if (IsKeyPressed(KEY_F2)) {
    auto& hb = session_.heartbeat();
    if (hb.is_paused()) hb.resume();
    else hb.pause();
  }
}

void ViewerApp::pump_telemetry_() {
  const auto now = std::chrono::steady_clock::now();
  if (now >= next_poll_) {
    next_poll_ = now + kTelemetryPollEvery;
    session_.poll_telemetry();
    telemetry_ = session_.telemetry();
  }
  while (hb_sub_.poll(hb_stats_)) {}
}

void ViewerApp::pump_events_() {
  UiEvent ev;
  while (events_.try_receive(ev)) {
    switch (ev.kind) {
      case UiEvent::Kind::Chunk: {
        if (ev.text.empty()) break;
        if (!streaming_line_open_) {
          log_.push_back(LogLine{false, ev.text, {}, false});
          streaming_line_open_ = true;
        } else {
          log_.back().text += " " + ev.text;
        }
        char note[32];
        std::snprintf(note, sizeof(note), "%llu ms", (unsigned long long)ev.latency_ms);
        log_.back().note = note;
        break;
      }
      case UiEvent::Kind::Done:
        streaming_line_open_ = false;
        busy_.store(false);
        break;
      case UiEvent::Kind::Failed:
        streaming_line_open_ = false;
        log_.push_back(LogLine{false, "(no reply)", ev.text, true});
        busy_.store(false);
        break;
    }
  }
  while (log_.size() > kMaxLogLines) log_.pop_front();
}

void ViewerApp::submit_(std::string text, bool is_retry) {
  join_transmit_();
  busy_.store(true);
  streaming_line_open_ = false;
  if (!is_retry) log_.push_back(LogLine{true, text, {}, false});
  transmit_th_ = std::thread(&ViewerApp::transmit_main_, this, std::move(text), is_retry);
}

void ViewerApp::join_transmit_() {
  if (transmit_th_.joinable()) transmit_th_.join();
}

void ViewerApp::transmit_main_(std::string text, bool is_retry) {
  auto post = [this](UiEvent ev) {
    if (!events_.send(std::move(ev))) STRATUS_LOG_DEBUG(kTag, "window closed, dropping reply event");
  };
  auto on_chunk = [&post](const StreamChunk& c) {
    post(UiEvent{UiEvent::Kind::Chunk, c.text, c.latency_ms});
  };
  try {
    if (is_retry) session_.retry(on_chunk);
    else session_.transmit(text, on_chunk);
    post(UiEvent{UiEvent::Kind::Done, {}, 0});
  } catch (const std::exception& e) {
    STRATUS_LOG_WARN(kTag, "transmission failed: %s", e.what());
    post(UiEvent{UiEvent::Kind::Failed, e.what(), 0});
  }
}

void ViewerApp::probe_main_() {
  std::unique_lock<std::mutex> lk(probe_mu_);
  while (!closing_) {
    lk.unlock();
    const bool up = session_.model_available();
    model_status_.store(static_cast<int>(up ? ModelStatus::Ready : ModelStatus::Offline));
    lk.lock();
    probe_wake_.wait_for(lk, kProbeEvery, [this]{ return closing_; });
  }
}

void ViewerApp::render_frame_() {
  BeginDrawing();
  ClearBackground(kBg);
  draw_header_();
  draw_telemetry_panel_();
  draw_comm_log_();
  draw_input_();
  EndDrawing();
}

void ViewerApp::draw_header_() {
  const int W = GetScreenWidth();
  DrawRectangle(0, 0, W, kHeaderH, kPanel);

  const bool fresh = session_.telemetry_fresh(kTelemetryFreshFor);
  const char* sim = (telemetry_ && !telemetry_->simulator.empty()) ? telemetry_->simulator.c_str() : "none";
  DrawText(TextFormat("SIM: %s", fresh ? sim : "disconnected"),
           kPad, 10, 20, fresh ? kAtcCol : kErrorCol);

  const auto status = static_cast<ModelStatus>(model_status_.load());
  const char* status_txt = status == ModelStatus::Ready   ? "ready"
                         : status == ModelStatus::Offline ? "offline"
                                                          : "checking";
  const Color status_col = status == ModelStatus::Ready   ? kAtcCol
                         : status == ModelStatus::Offline ? kErrorCol
                                                          : kWarnCol;
  DrawText(TextFormat("MODEL: %s (%s)", session_.config().model.c_str(), status_txt),
           kPad + 320, 10, 20, status_col);

  DrawText(TextFormat("warmup: %s%s  pings=%llu  last=%llu ms%s",
                      hb_stats_.is_running ? "on" : "off",
                      hb_stats_.is_paused ? " (paused)" : "",
                      (unsigned long long)hb_stats_.count,
                      (unsigned long long)hb_stats_.last_latency_ms,
                      busy_.load() ? "   transmitting..." : ""),
           kPad, 38, 16, kDim);
}

void ViewerApp::draw_telemetry_panel_() {
  const int H = GetScreenHeight();
  const int x0 = kPad, y0 = kHeaderH + kPad;
  DrawRectangle(x0, y0, kPanelW, H - y0 - kInputH - 2 * kPad, kPanel);

  int y = y0 + kPad;
  DrawText("TELEMETRY", x0 + kPad, y, 18, kText);
  y += kLineH + 6;

  if (!telemetry_) {
    DrawText(TextFormat("waiting for %s", TelemetryStore::kFileName), x0 + kPad, y, 14, kDim);
    return;
  }

  const TelemetrySnapshot& t = *telemetry_;
  const FlightContext ctx = derive_flight_context(t);
  char com1[16], com1s[16];
  fmt_freq(t.radios.com1_hz, com1, sizeof(com1));
  fmt_freq(t.radios.com1_standby_hz, com1s, sizeof(com1s));

  auto row = [&](const char* label, const char* value) {
    DrawText(label, x0 + kPad, y, 16, kDim);
    DrawText(value, x0 + kPad + 70, y, 16, kText);
    y += kLineH;
  };
  row("ACFT", t.aircraft.c_str());
  row("ALT",  TextFormat("%d ft MSL", ctx.altitude_ft));
  row("HDG",  TextFormat("%03d", ctx.heading_deg));
  row("GS",   TextFormat("%d kts", ctx.ground_speed_kts));
  row("IAS",  TextFormat("%.0f kts", t.speed.ias_kts));
  row("VS",   TextFormat("%.0f fpm", t.speed.vertical_speed_fpm));
  row("XPDR", TextFormat("%04d mode %d", ctx.squawk, (int)t.transponder.mode));
  row("COM1", TextFormat("%s / %s", com1, com1s));
  row("POS",  TextFormat("%.4f %.4f", t.position.latitude, t.position.longitude));
  row("PHASE", flight_phase_label(ctx.phase));
  if (t.state.paused) {
    y += 6;
    DrawText("SIM PAUSED", x0 + kPad, y, 16, kWarnCol);
  }
}

void ViewerApp::draw_comm_log_() {
  const int W = GetScreenWidth(), H = GetScreenHeight();
  const int x0 = kPad * 2 + kPanelW, y0 = kHeaderH + kPad;
  const int w = W - x0 - kPad;
  const int h = H - y0 - kInputH - 2 * kPad;
  DrawRectangle(x0, y0, w, h, kPanel);

  // Lay out bottom-up so the newest traffic stays visible.
  const int font = 16;
  const int text_w = w - 2 * kPad - 60;
  int y = y0 + h - kPad;
  for (auto it = log_.rbegin(); it != log_.rend() && y > y0 + kPad; ++it) {
    const std::string who = it->pilot ? "PILOT: " : "ATC: ";
    const auto lines = wrap_text(who + it->text, font, text_w);
    const Color col = it->error ? kErrorCol : (it->pilot ? kPilotCol : kAtcCol);
    y -= static_cast<int>(lines.size()) * kLineH;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const int ly = y + static_cast<int>(i) * kLineH;
      if (ly < y0 + kPad) continue;
      DrawText(lines[i].c_str(), x0 + kPad, ly, font, col);
    }
    if (!it->note.empty() && y >= y0 + kPad) {
      const std::string note = it->error ? std::string("!") : it->note;
      DrawText(note.c_str(), x0 + w - kPad - MeasureText(note.c_str(), 12), y + 2, 12, kDim);
    }
    y -= 4;
  }
}

void ViewerApp::draw_input_() {
  const int W = GetScreenWidth(), H = GetScreenHeight();
  const int y0 = H - kInputH - kPad;
  DrawRectangle(kPad, y0, W - 2 * kPad, kInputH, kPanel);
  DrawRectangleLines(kPad, y0, W - 2 * kPad, kInputH, busy_.load() ? kDim : kPilotCol);

  const bool blink = (static_cast<int>(GetTime() * 2.0) % 2) == 0;
  const std::string shown = "> " + input_ + (blink && !busy_.load() ? "_" : "");
  DrawText(shown.c_str(), kPad * 2, y0 + 12, 20, kText);
  DrawText("Enter: transmit | F5: retry | F2: pause warmup | Esc: quit",
           W - kPad * 2 - MeasureText("Enter: transmit | F5: retry | F2: pause warmup | Esc: quit", 12),
           y0 + 16, 12, kDim);
}

} // namespace stratus
