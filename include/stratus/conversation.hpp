#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <stratus/streaming.hpp>
#include <stratus/telemetry.hpp>

namespace stratus {

enum class Speaker { Pilot, Atc };

const char* speaker_label(Speaker s);  // "PILOT" / "ATC"

struct ConversationEntry {
  Speaker speaker = Speaker::Pilot;
  std::string message;
  std::chrono::system_clock::time_point timestamp{};
};

// Append-only transcript bounded to the most recent entries.
class ConversationHistory {
public:
  explicit ConversationHistory(std::size_t limit = 20);  // at least 2

  void append(Speaker speaker, std::string message);

  // While over the limit, drops the oldest exchange: a Pilot entry together
  // with the Atc reply that follows it, or a single leading entry that has no
  // partner. Never removes from the middle.
  void trim();

  // True if the newest entry is a Pilot message still waiting for a reply.
  bool awaiting_reply() const;

  // "PILOT: ..." / "ATC: ..." lines for the first `count` entries.
  std::string format(std::size_t count) const;

  const std::deque<ConversationEntry>& entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  std::size_t limit() const { return limit_; }
  void clear() { entries_.clear(); }

private:
  std::size_t limit_;
  std::deque<ConversationEntry> entries_;
};

inline constexpr double kMetersToFeet = 3.28084;
inline constexpr double kMpsToKnots = 1.94384;
inline constexpr int kPatternAltitudeFt = 1000;

enum class FlightPhase { OnGround, Pattern, InFlight };

const char* flight_phase_label(FlightPhase p);  // "on the ground" / "in the pattern" / "in flight"

struct FlightContext {
  int altitude_ft = 0;       // MSL
  int heading_deg = 0;       // magnetic
  int ground_speed_kts = 0;
  int squawk = 0;
  FlightPhase phase = FlightPhase::OnGround;
};

FlightContext derive_flight_context(const TelemetrySnapshot& t);

struct EngineConfig {
  std::string callsign = "N12345";
  std::string aircraft_type = "C172";
  std::size_t history_limit = 20;
};

// Deterministic controller instruction + transcript + the new pilot line.
std::string build_prompt(const EngineConfig& cfg,
                         const FlightContext& ctx,
                         const std::string& history_text,
                         const std::string& pilot_text);

// Turns pilot transmissions into ATC replies. One call in flight at a time;
// the caller serializes.
class ConversationEngine {
public:
  ConversationEngine(EngineConfig config, const StreamingGenerator& generator);

  // Records the pilot line, streams the reply through on_chunk and records it.
  // Generation errors propagate; the pilot line stays in the history.
  std::string process(const std::string& pilot_text,
                      const TelemetrySnapshot& telemetry,
                      const ChunkCallback& on_chunk = {});

  // Same as process() over the non-streaming path.
  std::string process_single_shot(const std::string& pilot_text, const TelemetrySnapshot& telemetry);

  // Regenerates the reply to the trailing unanswered pilot line without
  // recording it again. Throws std::logic_error if nothing is pending.
  std::string retry(const TelemetrySnapshot& telemetry, const ChunkCallback& on_chunk = {});

  const ConversationHistory& history() const { return history_; }
  void clear_history() { history_.clear(); }
  const EngineConfig& config() const { return config_; }

private:
  std::string pending_prompt_(const TelemetrySnapshot& telemetry) const;
  void record_pilot_(const std::string& pilot_text);
  std::string record_reply_(const std::string& reply);

  EngineConfig config_;
  const StreamingGenerator& generator_;
  ConversationHistory history_;
};

} // namespace stratus
