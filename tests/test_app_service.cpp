#include "snowid/app/app_service.h"
#include "snowid/core/clock.h"
#include "snowid/core/id128_codec.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <memory>

using namespace snowid;

namespace {

std::shared_ptr<core::SnowflakeGenerator> make_generator(std::shared_ptr<core::IClock> clock,
                                                         const core::GeneratorConfig& config) {
  auto created = core::SnowflakeGenerator::create(std::move(clock), config);
  REQUIRE(created.has_value());
  return created.value();
}

const core::GeneratorConfig kConfig{
    .version = 1, .datacenter_id = 2, .worker_id = 3, .process_id = 4, .default_sequence = 0};

}  // namespace

// ── generate_batch ──────────────────────────────────────────────────────────

TEST_CASE("generate_batch returns count ids in generation order", "[app][batch]") {
  auto gen = make_generator(std::make_shared<core::FixedClock>(15000), kConfig);

  const auto batch = app::generate_batch(app::BatchRequest{.count = 10}, *gen);
  REQUIRE(batch.has_value());
  REQUIRE(batch.value().size() == 10);
  for (std::size_t i = 0; i < 10; ++i) {
    CHECK(batch.value()[i].sequence() == i);
  }
}

TEST_CASE("generate_batch spans milliseconds as the clock moves", "[app][batch]") {
  auto clock = std::make_shared<core::ManualClock>(15000);
  auto gen = make_generator(clock, kConfig);
  REQUIRE(gen->generate().has_value());

  clock->advance(1);
  const auto batch = app::generate_batch(app::BatchRequest{.count = 3}, *gen);
  REQUIRE(batch.has_value());
  const auto& ids = batch.value();
  REQUIRE(ids.size() == 3);
  CHECK(ids[0].timestamp_ms() == 15001);
  CHECK(ids[0].sequence() == 0);
  CHECK(ids[2].sequence() == 2);
}

TEST_CASE("generate_batch uses the top sequence value then reports exhaustion",
          "[app][batch]") {
  core::GeneratorConfig config = kConfig;
  config.default_sequence = core::Id128::kMaxSequence - 2;  // three ids per millisecond
  auto gen = make_generator(std::make_shared<core::FixedClock>(15000), config);

  const auto fits = app::generate_batch(app::BatchRequest{.count = 3}, *gen);
  REQUIRE(fits.has_value());
  CHECK(fits.value().back().sequence() == core::Id128::kMaxSequence);

  const auto batch = app::generate_batch(app::BatchRequest{.count = 1}, *gen);
  REQUIRE_FALSE(batch.has_value());
  CHECK(batch.error() == core::GenerateError{core::GenerateErrorKind::kSequenceExhausted, 0});
}

TEST_CASE("generate_batch discards ids generated before a failure", "[app][batch]") {
  core::GeneratorConfig config = kConfig;
  config.default_sequence = core::Id128::kMaxSequence - 1;
  auto gen = make_generator(std::make_shared<core::FixedClock>(15000), config);

  const auto batch = app::generate_batch(app::BatchRequest{.count = 5}, *gen);
  REQUIRE_FALSE(batch.has_value());
  CHECK(batch.error().kind == core::GenerateErrorKind::kSequenceExhausted);
}

TEST_CASE("generate_batch returns a clock regression as is", "[app][batch]") {
  auto clock = std::make_shared<core::ManualClock>(15000);
  auto gen = make_generator(clock, kConfig);
  REQUIRE(gen->generate().has_value());
  clock->set(14990);

  const auto batch = app::generate_batch(app::BatchRequest{.count = 3}, *gen);

  REQUIRE_FALSE(batch.has_value());
  CHECK(batch.error() == core::GenerateError{core::GenerateErrorKind::kClockRegression, 10});
}

TEST_CASE("generate_batch with count 0 returns an empty batch", "[app][batch]") {
  auto gen = make_generator(std::make_shared<core::FixedClock>(15000), kConfig);
  const auto batch = app::generate_batch(app::BatchRequest{.count = 0}, *gen);
  REQUIRE(batch.has_value());
  CHECK(batch.value().empty());
}

// ── decode_id ───────────────────────────────────────────────────────────────

TEST_CASE("decode_id accepts both decimal and hex forms", "[app][decode]") {
  const auto id = core::Id128::from_fields(5, 15000, 123, 456, 789, 12345);

  const auto from_decimal = app::decode_id(core::to_decimal_string(id));
  REQUIRE(from_decimal.has_value());
  CHECK(from_decimal.value() == id);

  const auto from_hex = app::decode_id(core::to_hex_string(id));
  REQUIRE(from_hex.has_value());
  CHECK(from_hex.value() == id);
}

TEST_CASE("decode_id rejects other lengths", "[app][decode]") {
  const auto result = app::decode_id("12345");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == core::ParseError::kInvalidLength);
}

// ── Introspection ───────────────────────────────────────────────────────────

TEST_CASE("ids_per_millisecond follows default_sequence", "[app][info]") {
  CHECK(app::ids_per_millisecond(core::GeneratorConfig{}) == core::Id128::kMaxSequence + 1);
  CHECK(app::ids_per_millisecond(
            core::GeneratorConfig{.default_sequence = core::Id128::kMaxSequence - 2}) == 3);
  CHECK(app::ids_per_millisecond(
            core::GeneratorConfig{.default_sequence = core::Id128::kMaxSequence}) == 0);
}

TEST_CASE("generator_info_to_json reports coordinates and capacity", "[app][info]") {
  const auto j = app::generator_info_to_json(kConfig);
  CHECK(j.at("version").get<std::uint64_t>() == 1);
  CHECK(j.at("datacenter_id").get<std::uint64_t>() == 2);
  CHECK(j.at("worker_id").get<std::uint64_t>() == 3);
  CHECK(j.at("process_id").get<std::uint64_t>() == 4);
  CHECK(j.at("default_sequence").get<std::uint64_t>() == 0);
  CHECK(j.at("ids_per_millisecond").get<std::uint64_t>() == core::Id128::kMaxSequence + 1);
}
