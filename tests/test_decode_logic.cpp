#include "snowid/core/id128_codec.h"

#include "commands/decode_logic.h"
#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <sstream>
#include <string>

using namespace snowid;

TEST_CASE("execute_decode prints the fields of a decimal id", "[cli][decode]") {
  const auto id = core::Id128::from_fields(5, 15000, 123, 456, 789, 12345);
  std::ostringstream out;

  REQUIRE(execute_decode(core::to_decimal_string(id), out) == 0);

  const auto j = nlohmann::json::parse(out.str());
  CHECK(j.at("timestamp_ms").get<std::uint64_t>() == 15000);
  CHECK(j.at("sequence").get<std::uint64_t>() == 12345);
  CHECK(j.at("hex").get<std::string>() == core::to_hex_string(id));
}

TEST_CASE("execute_decode accepts a hex id", "[cli][decode]") {
  const auto id = core::Id128::from_fields(1, 2, 3, 4, 5, 6);
  std::ostringstream out;

  REQUIRE(execute_decode(core::to_hex_string(id), out) == 0);
  const auto j = nlohmann::json::parse(out.str());
  CHECK(j.at("id").get<std::string>() == core::to_decimal_string(id));
}

TEST_CASE("execute_decode prints one line in compact mode", "[cli][decode]") {
  const auto id = core::Id128::from_fields(1, 2, 3, 4, 5, 6);
  std::ostringstream out;

  REQUIRE(execute_decode(core::to_decimal_string(id), out, true) == 0);
  const std::string text = out.str();
  CHECK(text.find('\n') == text.size() - 1);
  CHECK(nlohmann::json::parse(text).at("process_id").get<std::uint64_t>() == 5);
}

TEST_CASE("execute_decode rejects garbage without output", "[cli][decode]") {
  std::ostringstream out;
  CHECK(execute_decode("not-an-id", out) == 1);
  CHECK(out.str().empty());
}
