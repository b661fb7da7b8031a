#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <thread>
#include <stratus/error.hpp>
#include <stratus/session.hpp>
#include "fake_transport.hpp"
#include "temp_dir.hpp"

using namespace stratus;
using testing::FakeTransport;
using testing::TempDir;
using testing::ndjson;

namespace {

AppConfig test_config(const TempDir& dir) {
  AppConfig cfg;
  cfg.data_dir = dir.path().string();
  cfg.warmup_interval = std::chrono::seconds(3600);
  cfg.min_chunk_chars = 1;
  return cfg;
}

} // namespace

TEST_CASE("AtcSession transmits with the latest telemetry") {
  TempDir dir;
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("N12345,"), ndjson(" radar contact.", true) };
  AtcSession session(test_config(dir), fake);

  REQUIRE_FALSE(session.telemetry());
  REQUIRE_FALSE(session.telemetry_fresh(std::chrono::seconds(5)));

  dir.write(TelemetryStore::kFileName, testing::telemetry_json(914.4, false, 4521));
  REQUIRE(session.poll_telemetry());
  REQUIRE(session.telemetry());
  REQUIRE(session.telemetry_fresh(std::chrono::seconds(5)));

  std::vector<std::string> chunks;
  const auto reply = session.transmit("Center, N12345, 3000", [&](const StreamChunk& c) {
    chunks.push_back(c.text);
  });
  REQUIRE(reply == "N12345, radar contact.");
  REQUIRE(chunks.size() == 2);

  const std::string prompt = fake->last_request().at("prompt").get<std::string>();
  REQUIRE(prompt.find("3000 ft MSL") != std::string::npos);
  REQUIRE(prompt.find("SQUAWK: 4521") != std::string::npos);

  const auto h = session.history();
  REQUIRE(h.size() == 2);
  REQUIRE(h[1].message == reply);
}

TEST_CASE("AtcSession keeps the last good snapshot when the file goes bad") {
  TempDir dir;
  dir.write(TelemetryStore::kFileName, testing::telemetry_json(100.0));
  auto fake = std::make_shared<FakeTransport>();
  AtcSession session(test_config(dir), fake);

  // Picked up at construction.
  REQUIRE(session.telemetry());

  dir.write(TelemetryStore::kFileName, "{ truncated");
  REQUIRE_FALSE(session.poll_telemetry());
  REQUIRE(session.telemetry());
  REQUIRE(session.telemetry()->position.altitude_msl_m == 100.0);
}

TEST_CASE("AtcSession holds the heartbeat around a transmission") {
  TempDir dir;
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Roger.", true) };
  AtcSession session(test_config(dir), fake);
  session.start();
  REQUIRE(session.heartbeat().is_running());

  bool held_during = false;
  session.transmit("radio check", [&](const StreamChunk&) {
    held_during = session.heartbeat().is_held();
  });
  REQUIRE(held_during);
  REQUIRE_FALSE(session.heartbeat().is_held());
  REQUIRE_FALSE(session.heartbeat().is_paused());

  SECTION("an existing pause survives the transmission") {
    session.heartbeat().pause();
    session.transmit("again", {});
    REQUIRE(session.heartbeat().is_paused());
  }

  SECTION("resume during a transmission waits for it to finish") {
    session.heartbeat().pause();
    bool pinged_during = true;
    session.transmit("again", [&](const StreamChunk&) {
      session.heartbeat().resume();
      pinged_during = session.heartbeat().run_cycle();
    });
    REQUIRE_FALSE(pinged_during);
    REQUIRE_FALSE(session.heartbeat().is_paused());
    REQUIRE_FALSE(session.heartbeat().is_held());
  }

  SECTION("pause during a transmission is kept afterwards") {
    session.transmit("again", [&](const StreamChunk&) {
      session.heartbeat().pause();
    });
    REQUIRE(session.heartbeat().is_paused());
    REQUIRE_FALSE(session.heartbeat().run_cycle());
  }

  SECTION("failure still releases the heartbeat") {
    fake->fail_with = ErrorKind::Transport;
    REQUIRE_THROWS_AS(session.transmit("anyone?", {}), Error);
    REQUIRE_FALSE(session.heartbeat().is_held());
    REQUIRE_FALSE(session.heartbeat().is_paused());
  }

  session.stop();
  REQUIRE_FALSE(session.heartbeat().is_running());
}

TEST_CASE("AtcSession retry answers the pending pilot line") {
  TempDir dir;
  auto fake = std::make_shared<FakeTransport>();
  fake->fail_with = ErrorKind::EndpointUnavailable;
  AtcSession session(test_config(dir), fake);

  REQUIRE_THROWS_AS(session.transmit("request taxi", {}), Error);
  fake->fail_with.reset();
  fake->stream_lines = { ndjson("Taxi via alpha.", true) };
  REQUIRE(session.retry() == "Taxi via alpha.");
  REQUIRE(session.history().size() == 2);
}

TEST_CASE("AtcSession leaves the heartbeat alone when warmup is disabled") {
  TempDir dir;
  auto fake = std::make_shared<FakeTransport>();
  auto cfg = test_config(dir);
  cfg.warmup_enabled = false;
  AtcSession session(cfg, fake);
  session.start();
  REQUIRE_FALSE(session.heartbeat().is_running());
  REQUIRE(session.model_available());
}

TEST_CASE("AtcSession serializes concurrent transmissions") {
  TempDir dir;
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Roger.", true) };
  AtcSession session(test_config(dir), fake);

  std::thread a([&]{ session.transmit("one", {}); });
  std::thread b([&]{ session.transmit("two", {}); });
  a.join();
  b.join();

  const auto h = session.history();
  REQUIRE(h.size() == 4);
  REQUIRE(h[0].speaker == Speaker::Pilot);
  REQUIRE(h[1].speaker == Speaker::Atc);
  REQUIRE(h[2].speaker == Speaker::Pilot);
  REQUIRE(h[3].speaker == Speaker::Atc);
}
