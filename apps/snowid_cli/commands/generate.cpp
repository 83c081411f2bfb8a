#include "generate.h"

#include "snowid/core/clock.h"
#include "snowid/core/id_generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include "shared/generator_options.h"
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  snowid::apps::GeneratorOptions generator;     // NOLINT(readability-identifier-naming)
  std::size_t count{1};                         // NOLINT(readability-identifier-naming)
  OutputFormat format{OutputFormat::kDecimal};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  std::vector<snowid::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of ids to generate",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = snowid::apps::parse_uint64(v);
         if (!parsed.has_value() || parsed.value() == 0) {
           std::cerr << "Invalid --count: " << v << " (expected positive integer)\n";
           return false;
         }
         c.count = static_cast<std::size_t>(parsed.value());
         return true;
       }},
      {"--format", true, "Output format (decimal|hex|json|debug)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = parse_output_format(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --format: " << v << " (valid: decimal, hex, json, debug)\n";
           return false;
         }
         c.format = parsed.value();
         return true;
       }},
  };
  snowid::apps::append_generator_options(options);
  const auto parsed = snowid::apps::parse_options(argc, argv, options, 2);
  for (const auto& arg : parsed.positional) {
    std::cerr << "Unexpected argument: " << arg << "\n";
  }
  if (!parsed.ok || !parsed.positional.empty()) {
    return 1;
  }
  const GenerateCliConfig& config = parsed.config;

  const auto generator_config = snowid::apps::resolve_generator_config(config.generator);
  if (!generator_config.has_value()) {
    std::cerr << "Error: " << generator_config.error() << "\n";
    return 1;
  }

  auto generator = snowid::core::SnowflakeGenerator::create(
      std::make_shared<snowid::core::SystemClock>(), generator_config.value());
  if (!generator.has_value()) {
    std::cerr << "Error: " << snowid::core::describe(generator.error()) << "\n";
    return 1;
  }

  const snowid::app::BatchRequest req{.count = config.count};
  return execute_generate(req, *generator.value(), config.format, std::cout);
}
