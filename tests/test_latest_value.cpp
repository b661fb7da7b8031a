#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>
#include <stratus/latest_value.hpp>
#include <stratus/warmup.hpp>

using namespace stratus;

TEST_CASE("LatestValue publishes and consumes latest") {
  LatestValue<HeartbeatStats> cell;
  HeartbeatStats s; s.count = 1;
  cell.publish(s);

  std::uint64_t cursor = 0;
  HeartbeatStats out{};
  // Should see new data
  REQUIRE(cell.try_consume_latest(cursor, out));
  REQUIRE(out.count == 1);
  // Second call without publish should return false
  REQUIRE_FALSE(cell.try_consume_latest(cursor, out));
}

TEST_CASE("LatestValue skips intermediate values") {
  LatestValue<int> cell;
  auto sub = cell.subscribe();
  cell.publish(1);
  cell.publish(2);
  cell.publish(3);

  int v = 0;
  REQUIRE(sub.poll(v));
  REQUIRE(v == 3);
  REQUIRE_FALSE(sub.poll(v));
}

TEST_CASE("LatestValue subscribers see the current value first") {
  LatestValue<int> cell(42);
  auto late = cell.subscribe();
  int v = 0;
  REQUIRE(late.poll(v));
  REQUIRE(v == 42);

  auto other = cell.subscribe();
  cell.publish(43);
  REQUIRE(other.poll(v));
  REQUIRE(v == 43);
  REQUIRE(late.poll(v));
  REQUIRE(v == 43);
}

TEST_CASE("LatestValue wait_next wakes on publish and times out otherwise") {
  LatestValue<int> cell;
  auto sub = cell.subscribe();
  int v = 0;
  REQUIRE_FALSE(sub.wait(v, std::chrono::milliseconds(10)));

  std::thread writer([&]{
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    cell.publish(5);
  });
  REQUIRE(sub.wait(v, std::chrono::seconds(2)));
  REQUIRE(v == 5);
  writer.join();
}
