#include "snowid/core/generator_config.h"
#include "snowid/core/id128.h"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

using namespace snowid::core;

// ── Validation ──────────────────────────────────────────────────────────────

TEST_CASE("validate_generator_config accepts every field at its maximum", "[config]") {
  const GeneratorConfig config{.version = Id128::kMaxVersion,
                               .datacenter_id = Id128::kMaxDatacenterId,
                               .worker_id = Id128::kMaxWorkerId,
                               .process_id = Id128::kMaxProcessId,
                               .default_sequence = Id128::kMaxSequence};
  const auto result = validate_generator_config(config);
  REQUIRE(result.has_value());
  CHECK(result.value() == config);
}

TEST_CASE("validate_generator_config names the offending field", "[config]") {
  SECTION("version") {
    GeneratorConfig config;
    config.version = 16;
    const auto result = validate_generator_config(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == ConfigError{ConfigField::kVersion, 16, Id128::kMaxVersion});
  }

  SECTION("datacenter_id") {
    GeneratorConfig config;
    config.datacenter_id = 1024;
    const auto result = validate_generator_config(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().field == ConfigField::kDatacenterId);
  }

  SECTION("process_id") {
    GeneratorConfig config;
    config.process_id = 5000;
    const auto result = validate_generator_config(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().field == ConfigField::kProcessId);
    CHECK(result.error().value == 5000);
  }

  SECTION("default_sequence") {
    GeneratorConfig config;
    config.default_sequence = Id128::kMaxSequence + 1;
    const auto result = validate_generator_config(config);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().field == ConfigField::kDefaultSequence);
  }
}

TEST_CASE("validate_generator_config reports the first bad field in declaration order",
          "[config]") {
  GeneratorConfig config;
  config.worker_id = 2000;
  config.datacenter_id = 2000;
  const auto result = validate_generator_config(config);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().field == ConfigField::kDatacenterId);
}

// ── JSON ────────────────────────────────────────────────────────────────────

TEST_CASE("generator_config_to_json writes sorted keys", "[config][json]") {
  const GeneratorConfig config{
      .version = 1, .datacenter_id = 2, .worker_id = 3, .process_id = 4, .default_sequence = 5};
  CHECK(generator_config_to_json(config) ==
        R"({"datacenter_id":2,"default_sequence":5,"process_id":4,"version":1,"worker_id":3})");
}

TEST_CASE("generator_config_from_json reads the file form", "[config][json]") {
  const auto config = generator_config_from_json(
      R"({"version": 1, "datacenter_id": 2, "worker_id": 3, "process_id": 4, "default_sequence": 5})");
  CHECK(config == GeneratorConfig{.version = 1,
                                  .datacenter_id = 2,
                                  .worker_id = 3,
                                  .process_id = 4,
                                  .default_sequence = 5});
}

TEST_CASE("generator_config_from_json defaults default_sequence to 0", "[config][json]") {
  const auto config = generator_config_from_json(
      R"({"version": 0, "datacenter_id": 7, "worker_id": 8, "process_id": 9})");
  CHECK(config.default_sequence == 0);
  CHECK(config.datacenter_id == 7);
}

TEST_CASE("generator_config_from_json does not range-check", "[config][json]") {
  const auto config = generator_config_from_json(
      R"({"version": 99, "datacenter_id": 0, "worker_id": 0, "process_id": 0})");
  CHECK(config.version == 99);
  CHECK_FALSE(validate_generator_config(config).has_value());
}

TEST_CASE("generator_config_from_json rejects malformed input", "[config][json]") {
  CHECK_THROWS_AS(generator_config_from_json("not json"), std::runtime_error);
  CHECK_THROWS_AS(generator_config_from_json("[1, 2, 3]"), std::runtime_error);
  CHECK_THROWS_AS(generator_config_from_json(R"({"version": 0, "datacenter_id": 0})"),
                  std::runtime_error);
  CHECK_THROWS_AS(
      generator_config_from_json(
          R"({"version": -1, "datacenter_id": 0, "worker_id": 0, "process_id": 0})"),
      std::runtime_error);
  CHECK_THROWS_AS(
      generator_config_from_json(
          R"({"version": "1", "datacenter_id": 0, "worker_id": 0, "process_id": 0})"),
      std::runtime_error);
}
