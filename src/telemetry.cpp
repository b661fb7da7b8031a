#include <stratus/telemetry.hpp>
#include <stratus/error.hpp>
#include <nlohmann/json.hpp>

namespace stratus {

using nlohmann::json;

static void decode_position(const json& j, Position& p) {
  j.at("latitude").get_to(p.latitude);
  j.at("longitude").get_to(p.longitude);
  j.at("altitude_msl_m").get_to(p.altitude_msl_m);
  j.at("altitude_agl_m").get_to(p.altitude_agl_m);
}

static void decode_orientation(const json& j, Orientation& o) {
  j.at("heading_mag").get_to(o.heading_mag);
  j.at("heading_true").get_to(o.heading_true);
  j.at("pitch").get_to(o.pitch);
  j.at("roll").get_to(o.roll);
}

static void decode_speed(const json& j, Speed& s) {
  j.at("ground_speed_mps").get_to(s.ground_speed_mps);
  j.at("ias_kts").get_to(s.ias_kts);
  j.at("tas_mps").get_to(s.tas_mps);
  j.at("vertical_speed_fpm").get_to(s.vertical_speed_fpm);
}

static void decode_radios(const json& j, Radios& r) {
  j.at("com1_hz").get_to(r.com1_hz);
  j.at("com1_standby_hz").get_to(r.com1_standby_hz);
  j.at("com2_hz").get_to(r.com2_hz);
  j.at("com2_standby_hz").get_to(r.com2_standby_hz);
  j.at("nav1_hz").get_to(r.nav1_hz);
  j.at("nav2_hz").get_to(r.nav2_hz);
}

TelemetrySnapshot parse_telemetry_json(const std::string& text) {
  try {
    const json j = json::parse(text);
    TelemetrySnapshot t;
    j.at("timestamp").get_to(t.timestamp);
    j.at("simulator").get_to(t.simulator);
    j.at("aircraft").get_to(t.aircraft);
    decode_position(j.at("position"), t.position);
    decode_orientation(j.at("orientation"), t.orientation);
    decode_speed(j.at("speed"), t.speed);
    decode_radios(j.at("radios"), t.radios);
    j.at("transponder").at("code").get_to(t.transponder.code);
    j.at("transponder").at("mode").get_to(t.transponder.mode);
    j.at("state").at("on_ground").get_to(t.state.on_ground);
    j.at("state").at("paused").get_to(t.state.paused);
    return t;
  } catch (const json::exception& e) {
    throw Error(ErrorKind::FileParse, e.what());
  }
}

} // namespace stratus
