#include "config.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace snowid::server {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_require_coordinates(ServerConfig& config, const std::string& /*value*/) {
  config.require_coordinates = true;
  return true;
}

bool handle_max_batch(ServerConfig& config, const std::string& value) {
  const auto parsed = apps::parse_uint64(value);
  if (!parsed.has_value() || parsed.value() == 0) {
    std::cerr << "Invalid --max-batch: " << value << " (expected positive integer)\n";
    config.args_valid = false;
    return false;
  }
  config.max_batch = static_cast<std::size_t>(parsed.value());
  return true;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<ServerConfig>> build_option_registry() {
  std::vector<apps::Option<ServerConfig>> options = {
      {"--require-coordinates", false,
       "Refuse to start without explicit datacenter/worker/process coordinates",
       handle_require_coordinates},
      {"--max-batch", true, "Maximum ids per generate_id call", handle_max_batch},
  };
  apps::append_generator_options(options);
  return options;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

ServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = build_option_registry();
  auto parsed = apps::parse_options(argc, argv, options);

  for (const auto& arg : parsed.positional) {
    std::cerr << "Unexpected argument: " << arg << "\n";
    parsed.ok = false;
  }
  if (!parsed.ok) {
    parsed.config.args_valid = false;
  }
  return parsed.config;
}

}  // namespace snowid::server
