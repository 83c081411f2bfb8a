#include "snowid/core/result.h"

#include <catch2/catch.hpp>

#include <string>

using namespace snowid::core;

TEST_CASE("Result holds either a value or an error", "[result]") {
  const auto ok = Result<int, ParseError>::ok(42);
  REQUIRE(ok.has_value());
  CHECK(ok.value() == 42);

  const auto err = Result<int, ParseError>::err(ParseError::kInvalidDigit);
  REQUIRE_FALSE(err.has_value());
  CHECK(err.error() == ParseError::kInvalidDigit);
}

TEST_CASE("describe renders a message for every error", "[result]") {
  CHECK(describe(ConfigError{ConfigField::kWorkerId, 2000, 1023}) ==
        "Invalid configuration: worker_id = 2000 exceeds maximum 1023");
  CHECK(describe(ConfigError{ConfigField::kClock, 0, 0}) ==
        "Invalid configuration: clock must not be null");

  CHECK(describe(GenerateError{GenerateErrorKind::kClockRegression, 5}) ==
        "Clock moved backwards. Refusing to generate id for 5 milliseconds");
  CHECK(describe(GenerateError{GenerateErrorKind::kSequenceExhausted, 1}) ==
        "Sequence exhausted. Refusing to generate id for 1 increments");

  CHECK(describe(ParseError::kInvalidLength) == "Invalid length");
  CHECK(describe(ParseError::kInvalidDigit) == "Invalid digit");
  CHECK(describe(ParseError::kOutOfRange) == "Value out of range");
}

TEST_CASE("to_string names each config field", "[result]") {
  CHECK(std::string(to_string(ConfigField::kVersion)) == "version");
  CHECK(std::string(to_string(ConfigField::kDatacenterId)) == "datacenter_id");
  CHECK(std::string(to_string(ConfigField::kDefaultSequence)) == "default_sequence");
}
