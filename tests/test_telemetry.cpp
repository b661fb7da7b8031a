#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <stratus/error.hpp>
#include <stratus/telemetry.hpp>
#include <stratus/telemetry_store.hpp>
#include "temp_dir.hpp"

using namespace stratus;
using Catch::Approx;
using testing::TempDir;
using testing::telemetry_json;

TEST_CASE("parse_telemetry_json reads every field") {
  const auto t = parse_telemetry_json(telemetry_json(1524.0, false, 4521));
  REQUIRE(t.timestamp == 1700000000);
  REQUIRE(t.simulator == "MSFS");
  REQUIRE(t.aircraft == "Cessna 172");
  REQUIRE(t.position.altitude_msl_m == Approx(1524.0));
  REQUIRE(t.orientation.heading_mag == Approx(271.6));
  REQUIRE(t.speed.ground_speed_mps == Approx(51.44));
  REQUIRE(t.radios.com1_hz == 118300000);
  REQUIRE(t.transponder.code == 4521);
  REQUIRE(t.transponder.mode == 4);
  REQUIRE_FALSE(t.state.on_ground);
}

TEST_CASE("parse_telemetry_json rejects bad documents") {
  auto kind_of = [](const std::string& text) {
    try {
      parse_telemetry_json(text);
    } catch (const Error& e) {
      return e.kind();
    }
    return ErrorKind::Transport;  // no throw
  };

  REQUIRE(kind_of("{not json") == ErrorKind::FileParse);
  REQUIRE(kind_of("{}") == ErrorKind::FileParse);

  std::string missing = telemetry_json();
  missing.replace(missing.find("\"pitch\""), std::string("\"pitch\"").size(), "\"pitchx\"");
  REQUIRE(kind_of(missing) == ErrorKind::FileParse);

  std::string mistyped = telemetry_json();
  mistyped.replace(mistyped.find("\"MSFS\""), 6, "42");
  REQUIRE(kind_of(mistyped) == ErrorKind::FileParse);
}

TEST_CASE("TelemetryStore reads the file in its data directory") {
  TempDir dir;
  TelemetryStore store(dir.path());
  REQUIRE(store.file_path().string() == (dir.path() / TelemetryStore::kFileName).string());

  try {
    store.read();
    FAIL("expected an error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::FileAccess);
  }

  dir.write(TelemetryStore::kFileName, telemetry_json(100.0));
  REQUIRE(store.read().position.altitude_msl_m == Approx(100.0));

  dir.write(TelemetryStore::kFileName, "garbage");
  try {
    store.read();
    FAIL("expected an error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::FileParse);
  }
}

TEST_CASE("TelemetryStore creates a missing data directory") {
  TempDir dir;
  const auto nested = dir.path() / "a" / "b";
  TelemetryStore store(nested);
  REQUIRE(std::filesystem::is_directory(nested));
}

TEST_CASE("TelemetryStore refuses a data directory that is a file") {
  TempDir dir;
  dir.write("plain", "x");
  try {
    TelemetryStore store(dir.path() / "plain");
    FAIL("expected an error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::WatchSetup);
  }
}

TEST_CASE("TelemetryStore poll reads once per burst of changes") {
  TempDir dir;
  TelemetryStore store(dir.path());
  REQUIRE_FALSE(store.poll());

  dir.write(TelemetryStore::kFileName, telemetry_json(200.0));
  dir.write(TelemetryStore::kFileName, telemetry_json(300.0));
  auto snap = store.poll();
  REQUIRE(snap);
  REQUIRE(snap->position.altitude_msl_m == Approx(300.0));

  // Everything was drained by the previous poll.
  REQUIRE_FALSE(store.poll());
}

#if defined(__linux__)
TEST_CASE("TelemetryStore ignores other files in the directory") {
  TempDir dir;
  TelemetryStore store(dir.path());
  dir.write("unrelated.json", "{}");
  REQUIRE_FALSE(store.poll());
}
#endif

TEST_CASE("default data directory ends in the application folder") {
  REQUIRE(TelemetryStore::default_data_dir().filename().string() == "StratusATC");
}
