#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <stratus/error.hpp>
#include <stratus/streaming.hpp>
#include "fake_transport.hpp"

using namespace stratus;
using testing::FakeTransport;
using testing::ndjson;

namespace {

StreamingGenerator make_generator(std::shared_ptr<FakeTransport> fake, ChunkLimits limits = {10, 100}) {
  StreamConfig cfg;
  cfg.limits = limits;
  cfg.channel_capacity = 2;
  return StreamingGenerator(OllamaClient(std::move(fake), "tiny"), cfg);
}

std::vector<StreamChunk> drain(ChunkStream& s) {
  std::vector<StreamChunk> out;
  StreamChunk c;
  while (s.next(c)) out.push_back(c);
  return out;
}

} // namespace

TEST_CASE("stream yields phrase chunks in order with one final chunk last") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = {
    ndjson("N12345,"), ndjson(" Tower,"), ndjson(" runway two seven,"),
    ndjson(" cleared"), ndjson(" to land."), ndjson("", true),
  };
  auto gen = make_generator(fake);

  auto stream = gen.generate_stream("prompt");
  const auto chunks = drain(stream);
  REQUIRE_FALSE(stream.truncated());

  REQUIRE(chunks.size() >= 2);
  std::size_t finals = 0;
  for (const auto& c : chunks) finals += c.is_final ? 1 : 0;
  REQUIRE(finals == 1);
  REQUIRE(chunks.back().is_final);

  std::string joined;
  for (const auto& c : chunks) {
    if (c.text.empty()) continue;
    if (!joined.empty()) joined += ' ';
    joined += c.text;
  }
  REQUIRE(joined == "N12345, Tower, runway two seven, cleared to land.");

  for (std::size_t i = 1; i < chunks.size(); ++i) {
    REQUIRE(chunks[i].latency_ms >= chunks[i - 1].latency_ms);
  }

  const auto req = fake->last_request();
  REQUIRE(req.at("stream") == true);
  REQUIRE(req.at("prompt") == "prompt");
}

TEST_CASE("undecodable and blank lines are skipped") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = {
    ndjson("Roger,"), "garbage{", "", R"({"response":7})", ndjson(" wilco."), ndjson("", true),
  };
  auto gen = make_generator(fake, {1, 100});
  std::vector<std::string> texts;
  const auto full = gen.generate_with_callback("p", [&](const StreamChunk& c) { texts.push_back(c.text); });
  REQUIRE(full == "Roger, wilco.");
  REQUIRE(texts.size() == 3);
  REQUIRE(texts[0] == "Roger,");
  REQUIRE(texts[1] == "wilco.");
  REQUIRE(texts[2].empty());
}

TEST_CASE("lines after the done marker are ignored") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Contact departure", true), ndjson("extra.") };
  auto gen = make_generator(fake);
  REQUIRE(gen.generate_with_callback("p", {}) == "Contact departure");
}

TEST_CASE("rejected request surfaces as an error before any chunk") {
  auto fake = std::make_shared<FakeTransport>();
  fake->fail_with = ErrorKind::EndpointUnavailable;
  auto gen = make_generator(fake);

  int calls = 0;
  try {
    gen.generate_with_callback("p", [&](const StreamChunk&) { ++calls; });
    FAIL("expected an error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::EndpointUnavailable);
  }
  REQUIRE(calls == 0);
}

TEST_CASE("stream ending without done is reported as truncated") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Hold short "), ndjson("runway") };
  fake->stream_fails_at_end = true;
  auto gen = make_generator(fake);

  SECTION("raw stream delivers the remainder and flags truncation") {
    auto stream = gen.generate_stream("p");
    const auto chunks = drain(stream);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].text == "Hold short runway");
    REQUIRE_FALSE(chunks[0].is_final);
    REQUIRE(stream.truncated());
  }

  SECTION("callback path delivers then throws") {
    std::vector<std::string> texts;
    try {
      gen.generate_with_callback("p", [&](const StreamChunk& c) { texts.push_back(c.text); });
      FAIL("expected an error");
    } catch (const Error& e) {
      REQUIRE(e.kind() == ErrorKind::StreamTruncated);
    }
    REQUIRE(texts == std::vector<std::string>{"Hold short runway"});
  }
}

TEST_CASE("streamed text matches the single-shot reply") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Squawk"), ndjson(" four five,"), ndjson(" six two."), ndjson("", true) };
  fake->post_reply = R"({"response":" Squawk four five, six two. ","done":true})";
  auto gen = make_generator(fake, {1, 100});

  REQUIRE(gen.generate_with_callback("p", {}) == gen.generate("p"));
  REQUIRE(fake->streams() == 1);
  REQUIRE(fake->posts() == 1);
}

TEST_CASE("dropping the stream early releases the producer") {
  auto fake = std::make_shared<FakeTransport>();
  for (int i = 0; i < 50; ++i) fake->stream_lines.push_back(ndjson("Traffic,"));
  fake->stream_lines.push_back(ndjson("", true));
  auto gen = make_generator(fake, {1, 100});

  {
    auto stream = gen.generate_stream("p");
    StreamChunk c;
    REQUIRE(stream.next(c));
    REQUIRE(c.text == "Traffic,");
  }  // destructor joins; hangs here if the producer stayed blocked

  auto moved = gen.generate_stream("p");
  ChunkStream other = std::move(moved);
  StreamChunk c;
  REQUIRE(other.next(c));
  other = gen.generate_stream("p");
  REQUIRE(other.next(c));
}

TEST_CASE("dropping a stalled stream cancels the read instead of waiting it out") {
  auto fake = std::make_shared<FakeTransport>();
  fake->stream_lines = { ndjson("Traffic twelve o'clock,") };
  fake->stream_holds_open = true;
  auto gen = make_generator(fake, {1, 100});

  const auto start = std::chrono::steady_clock::now();
  {
    auto stream = gen.generate_stream("p");
    StreamChunk c;
    REQUIRE(stream.next(c));
    REQUIRE(c.text == "Traffic twelve o'clock,");
  }  // producer is parked in next_line until cancelled
  const auto waited = std::chrono::steady_clock::now() - start;

  REQUIRE(fake->cancels() == 1);
  REQUIRE(waited < std::chrono::seconds(2));
}

TEST_CASE("is_available probes the endpoint") {
  auto fake = std::make_shared<FakeTransport>();
  auto gen = make_generator(fake);
  REQUIRE(gen.is_available());
  fake->available = false;
  REQUIRE_FALSE(gen.is_available());
  REQUIRE(fake->probes() == 2);
}
