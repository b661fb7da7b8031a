#pragma once
#include <cstdint>
#include <string>

namespace stratus {

struct Position {
  double latitude = 0.0;        // deg
  double longitude = 0.0;       // deg
  double altitude_msl_m = 0.0;  // meters above mean sea level
  double altitude_agl_m = 0.0;  // meters above ground
};

struct Orientation {
  double heading_mag = 0.0;   // deg
  double heading_true = 0.0;  // deg
  double pitch = 0.0;         // deg
  double roll = 0.0;          // deg
};

struct Speed {
  double ground_speed_mps = 0.0;
  double ias_kts = 0.0;
  double tas_mps = 0.0;
  double vertical_speed_fpm = 0.0;
};

struct Radios {
  std::int32_t com1_hz = 0;
  std::int32_t com1_standby_hz = 0;
  std::int32_t com2_hz = 0;
  std::int32_t com2_standby_hz = 0;
  std::int32_t nav1_hz = 0;
  std::int32_t nav2_hz = 0;
};

struct Transponder {
  std::int32_t code = 0;  // e.g. 1200
  std::int32_t mode = 0;
};

struct FlightState {
  bool on_ground = false;
  bool paused = false;
};

// Single immutable sample of simulator state, written by the sim bridge.
struct TelemetrySnapshot {
  std::int64_t timestamp = 0;
  std::string simulator;
  std::string aircraft;
  Position position;
  Orientation orientation;
  Speed speed;
  Radios radios;
  Transponder transponder;
  FlightState state;
};

// Decodes the bridge's JSON document. Every field is required.
// Throws Error(FileParse) on malformed or incomplete input.
TelemetrySnapshot parse_telemetry_json(const std::string& text);

} // namespace stratus
