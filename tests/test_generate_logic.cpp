#include "snowid/core/clock.h"
#include "snowid/core/id128_codec.h"

#include "commands/generate_logic.h"
#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace snowid;

namespace {

std::shared_ptr<core::SnowflakeGenerator> make_generator(std::uint64_t default_sequence = 0) {
  auto created = core::SnowflakeGenerator::create(
      std::make_shared<core::FixedClock>(15000),
      core::GeneratorConfig{.version = 5,
                            .datacenter_id = 123,
                            .worker_id = 456,
                            .process_id = 789,
                            .default_sequence = default_sequence});
  REQUIRE(created.has_value());
  return created.value();
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

}  // namespace

TEST_CASE("parse_output_format maps every known name", "[cli][generate]") {
  CHECK(parse_output_format("decimal") == OutputFormat::kDecimal);
  CHECK(parse_output_format("hex") == OutputFormat::kHex);
  CHECK(parse_output_format("json") == OutputFormat::kJson);
  CHECK(parse_output_format("debug") == OutputFormat::kDebug);
  CHECK_FALSE(parse_output_format("base64").has_value());
}

TEST_CASE("execute_generate prints one decimal id per line", "[cli][generate]") {
  auto gen = make_generator();
  std::ostringstream out;

  const int rc = execute_generate(app::BatchRequest{.count = 3}, *gen, OutputFormat::kDecimal, out);
  REQUIRE(rc == 0);

  const auto lines = split_lines(out.str());
  REQUIRE(lines.size() == 3);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto parsed = core::parse_decimal_string(lines[i]);
    REQUIRE(parsed.has_value());
    CHECK(parsed.value().sequence() == i);
    CHECK(parsed.value().timestamp_ms() == 15000);
  }
}

TEST_CASE("execute_generate prints hex ids", "[cli][generate]") {
  auto gen = make_generator();
  std::ostringstream out;

  REQUIRE(execute_generate(app::BatchRequest{.count = 2}, *gen, OutputFormat::kHex, out) == 0);

  const auto lines = split_lines(out.str());
  REQUIRE(lines.size() == 2);
  CHECK(lines[0].size() == core::kId128HexLength);
  CHECK(core::parse_hex_string(lines[1]).has_value());
}

TEST_CASE("execute_generate prints a JSON array", "[cli][generate]") {
  auto gen = make_generator();
  std::ostringstream out;

  REQUIRE(execute_generate(app::BatchRequest{.count = 2}, *gen, OutputFormat::kJson, out) == 0);

  const auto j = nlohmann::json::parse(out.str());
  REQUIRE(j.is_array());
  REQUIRE(j.size() == 2);
  CHECK(j[0].at("worker_id").get<std::uint64_t>() == 456);
  CHECK(j[1].at("sequence").get<std::uint64_t>() == 1);
}

TEST_CASE("execute_generate prints debug lines", "[cli][generate]") {
  auto gen = make_generator();
  std::ostringstream out;

  REQUIRE(execute_generate(app::BatchRequest{.count = 1}, *gen, OutputFormat::kDebug, out) == 0);
  CHECK(out.str() ==
        "Id128(version=5, timestamp_ms=15000, datacenter_id=123, worker_id=456, "
        "process_id=789, sequence=0)\n");
}

TEST_CASE("execute_generate fails without partial output", "[cli][generate]") {
  auto gen = make_generator(core::Id128::kMaxSequence - 1);
  std::ostringstream out;

  const int rc =
      execute_generate(app::BatchRequest{.count = 3}, *gen, OutputFormat::kDecimal, out);
  CHECK(rc == 1);
  CHECK(out.str().empty());
}
