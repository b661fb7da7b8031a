#include <stratus/conversation.hpp>
#include <stratus/log.hpp>
#include <cstdio>
#include <stdexcept>

namespace stratus {

static constexpr const char* kTag = "atc";

const char* speaker_label(Speaker s) {
  return s == Speaker::Pilot ? "PILOT" : "ATC";
}

// ---- ConversationHistory ----

// Room for at least one full exchange.
ConversationHistory::ConversationHistory(std::size_t limit) : limit_(limit < 2 ? 2 : limit) {}

void ConversationHistory::append(Speaker speaker, std::string message) {
  entries_.push_back(ConversationEntry{speaker, std::move(message), std::chrono::system_clock::now()});
}

void ConversationHistory::trim() {
  while (entries_.size() > limit_) {
    const bool pair = entries_.size() >= 2 &&
                      entries_[0].speaker == Speaker::Pilot &&
                      entries_[1].speaker == Speaker::Atc;
    entries_.pop_front();
    if (pair) entries_.pop_front();
  }
}

bool ConversationHistory::awaiting_reply() const {
  return !entries_.empty() && entries_.back().speaker == Speaker::Pilot;
}

std::string ConversationHistory::format(std::size_t count) const {
  std::string out;
  const std::size_t n = count < entries_.size() ? count : entries_.size();
  for (std::size_t i = 0; i < n; ++i) {
    out += speaker_label(entries_[i].speaker);
    out += ": ";
    out += entries_[i].message;
    out += '\n';
  }
  return out;
}

// ---- Flight context ----

const char* flight_phase_label(FlightPhase p) {
  switch (p) {
    case FlightPhase::OnGround: return "on the ground";
    case FlightPhase::Pattern:  return "in the pattern";
    case FlightPhase::InFlight: return "in flight";
  }
  return "in flight";
}

FlightContext derive_flight_context(const TelemetrySnapshot& t) {
  FlightContext c;
  // Truncation toward zero, matching the cockpit readouts the bridge shows.
  c.altitude_ft      = static_cast<int>(t.position.altitude_msl_m * kMetersToFeet);
  c.heading_deg      = static_cast<int>(t.orientation.heading_mag);
  c.ground_speed_kts = static_cast<int>(t.speed.ground_speed_mps * kMpsToKnots);
  c.squawk           = t.transponder.code;

  if (t.state.on_ground)                   c.phase = FlightPhase::OnGround;
  else if (c.altitude_ft < kPatternAltitudeFt) c.phase = FlightPhase::Pattern;
  else                                     c.phase = FlightPhase::InFlight;
  return c;
}

std::string build_prompt(const EngineConfig& cfg,
                         const FlightContext& ctx,
                         const std::string& history_text,
                         const std::string& pilot_text) {
  char squawk[16];
  std::snprintf(squawk, sizeof(squawk), "%04d", ctx.squawk);

  std::string p;
  p += "You are an FAA Air Traffic Controller. Respond with proper ATC phraseology.\n\n";
  p += "AIRCRAFT: " + cfg.callsign + " (" + cfg.aircraft_type + ")\n";
  p += "POSITION: " + std::string(flight_phase_label(ctx.phase)) +
       " at " + std::to_string(ctx.altitude_ft) + " ft MSL, heading " +
       std::to_string(ctx.heading_deg) + "\u00B0, " + std::to_string(ctx.ground_speed_kts) + " kts\n";
  p += "SQUAWK: " + std::string(squawk) + "\n\n";
  p += "RULES:\n"
       "1. Use standard FAA phraseology\n"
       "2. Be concise - real ATC is brief\n"
       "3. Include callsign in every transmission\n"
       "4. If unclear, ask pilot to \"say again\"\n\n"
       "Respond ONLY with what ATC would say. No explanations.\n\n";
  p += "CONVERSATION:\n";
  p += history_text;
  p += "PILOT: " + pilot_text + "\nATC:";
  return p;
}

// ---- ConversationEngine ----

ConversationEngine::ConversationEngine(EngineConfig config, const StreamingGenerator& generator)
  : config_(std::move(config)), generator_(generator), history_(config_.history_limit) {}

std::string ConversationEngine::pending_prompt_(const TelemetrySnapshot& telemetry) const {
  // Everything before the trailing pilot line is context; the line itself is
  // rendered as the open transmission.
  const auto& entries = history_.entries();
  const std::string& pilot_text = entries.back().message;
  return build_prompt(config_, derive_flight_context(telemetry),
                      history_.format(entries.size() - 1), pilot_text);
}

void ConversationEngine::record_pilot_(const std::string& pilot_text) {
  history_.append(Speaker::Pilot, pilot_text);
  history_.trim();
  STRATUS_LOG_INFO(kTag, "PILOT: %s", pilot_text.c_str());
}

std::string ConversationEngine::record_reply_(const std::string& reply) {
  std::string text = trim_copy(reply);
  history_.append(Speaker::Atc, text);
  history_.trim();
  return text;
}

std::string ConversationEngine::process(const std::string& pilot_text,
                                        const TelemetrySnapshot& telemetry,
                                        const ChunkCallback& on_chunk) {
  record_pilot_(pilot_text);
  const std::string reply = generator_.generate_with_callback(pending_prompt_(telemetry), on_chunk);
  const std::string text = record_reply_(reply);
  STRATUS_LOG_INFO(kTag, "ATC: %s", text.c_str());
  return text;
}

std::string ConversationEngine::process_single_shot(const std::string& pilot_text,
                                                    const TelemetrySnapshot& telemetry) {
  record_pilot_(pilot_text);
  const std::string reply = generator_.generate(pending_prompt_(telemetry));
  const std::string text = record_reply_(reply);
  STRATUS_LOG_INFO(kTag, "ATC: %s", text.c_str());
  return text;
}

std::string ConversationEngine::retry(const TelemetrySnapshot& telemetry, const ChunkCallback& on_chunk) {
  if (!history_.awaiting_reply()) throw std::logic_error("no pilot transmission awaiting a reply");
  STRATUS_LOG_INFO(kTag, "retrying: %s", history_.entries().back().message.c_str());
  const std::string reply = generator_.generate_with_callback(pending_prompt_(telemetry), on_chunk);
  const std::string text = record_reply_(reply);
  STRATUS_LOG_INFO(kTag, "ATC: %s", text.c_str());
  return text;
}

} // namespace stratus
