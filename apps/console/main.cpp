#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <stratus/config.hpp>
#include <stratus/conversation.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <stratus/session.hpp>

using namespace stratus;

static void print_chunk(const StreamChunk& c) {
  if (c.text.empty()) return;
  std::printf("  ATC [%4llu ms]%s %s\n", (unsigned long long)c.latency_ms,
              c.is_final ? "*" : " ", c.text.c_str());
  std::fflush(stdout);
}

static void print_status(AtcSession& session) {
  const HeartbeatStats hb = session.heartbeat().stats().get();
  std::printf("warmup: %s%s, %llu pings, last %llu ms\n",
              hb.is_running ? "running" : "stopped",
              hb.is_paused ? " (paused)" : "",
              (unsigned long long)hb.count,
              (unsigned long long)hb.last_latency_ms);

  session.poll_telemetry();
  const auto t = session.telemetry();
  if (!t) {
    std::printf("telemetry: none yet (%s)\n", session.store().file_path().string().c_str());
    return;
  }
  const FlightContext ctx = derive_flight_context(*t);
  std::printf("telemetry: %s %s, %s, %d ft, hdg %03d, %d kts, squawk %04d%s\n",
              t->simulator.c_str(), t->aircraft.c_str(),
              flight_phase_label(ctx.phase),
              ctx.altitude_ft, ctx.heading_deg, ctx.ground_speed_kts, ctx.squawk,
              session.telemetry_fresh(std::chrono::seconds(5)) ? "" : " (stale)");
}

int main(int argc, char** argv) {
  AppConfig cfg;
  if (argc > 1) {
    auto loaded = load_config_file(argv[1]);
    if (!loaded) {
      std::fprintf(stderr, "cannot open config %s\n", argv[1]);
      return 2;
    }
    cfg = *loaded;
  }
  apply_env_overrides(cfg);
  set_log_level(cfg.log_level);

  try {
    AtcSession session(cfg);
    if (!session.model_available()) {
      STRATUS_LOG_WARN("main", "no model endpoint answering at %s", cfg.endpoint.c_str());
    }
    session.start();

    std::printf("%s, %s. Type a transmission; /retry /ping /status /quit\n",
                cfg.callsign.c_str(), cfg.aircraft_type.c_str());
    std::string line;
    while (std::printf("> "), std::fflush(stdout), std::getline(std::cin, line)) {
      const std::string text = trim_copy(line);
      if (text.empty()) continue;
      if (text == "/quit") break;

      try {
        if (text == "/ping") {
          std::printf("ping: %llu ms\n", (unsigned long long)session.heartbeat().force_ping());
        } else if (text == "/status") {
          print_status(session);
        } else if (text == "/retry") {
          session.retry(print_chunk);
        } else {
          session.poll_telemetry();
          session.transmit(text, print_chunk);
        }
      } catch (const Error& e) {
        std::printf("  (no reply: %s)\n", e.what());
      } catch (const std::logic_error& e) {
        std::printf("  (%s)\n", e.what());
      }
    }

    session.stop();
  } catch (const Error& e) {
    STRATUS_LOG_ERROR("main", "%s", e.what());
    return 1;
  }
  return 0;
}
