#include "snowid/core/clock.h"
#include "snowid/core/time.h"

#include <catch2/catch.hpp>

#include <chrono>
#include <cstdint>

using namespace snowid::core;

TEST_CASE("FixedClock returns its constructor value", "[clock]") {
  FixedClock clock(1700000000000ull);
  CHECK(clock.now_epoch_millis() == 1700000000000ull);
  CHECK(clock.now_epoch_millis() == 1700000000000ull);
}

TEST_CASE("ManualClock follows set and advance", "[clock]") {
  ManualClock clock(15000);
  CHECK(clock.now_epoch_millis() == 15000);

  clock.advance(1);
  CHECK(clock.now_epoch_millis() == 15001);

  clock.set(14000);
  CHECK(clock.now_epoch_millis() == 14000);
}

TEST_CASE("SystemClock reports wall-clock milliseconds", "[clock]") {
  SystemClock clock;
  const std::uint64_t before = to_unix_millis(now_utc());
  const std::uint64_t reading = clock.now_epoch_millis();
  const std::uint64_t after = to_unix_millis(now_utc());

  CHECK(reading >= before);
  CHECK(reading <= after);
  // 2020-01-01T00:00:00Z; any sane host clock is past this.
  CHECK(reading > 1577836800000ull);
}

TEST_CASE("to_unix_millis counts milliseconds since the Unix epoch", "[clock][time]") {
  CHECK(to_unix_millis(Timestamp{}) == 0);
  CHECK(to_unix_millis(Timestamp{} + std::chrono::milliseconds(1700000000123)) ==
        1700000000123ull);
  // Sub-millisecond remainder is dropped.
  CHECK(to_unix_millis(Timestamp{} + std::chrono::microseconds(2999)) == 2);
}

TEST_CASE("to_unix_millis clamps times before the epoch to 0", "[clock][time]") {
  CHECK(to_unix_millis(Timestamp{} - std::chrono::milliseconds(5)) == 0);
  CHECK(to_unix_millis(Timestamp{} - std::chrono::hours(24 * 365)) == 0);
  CHECK(to_unix_millis(Timestamp{} - std::chrono::microseconds(1)) == 0);
}
