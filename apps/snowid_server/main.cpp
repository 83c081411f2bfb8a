#include "snowid/core/clock.h"
#include "snowid/core/id_generator.h"
#include "snowid/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "shared/generator_options.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

using namespace snowid;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = server::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  const auto generator_config = apps::resolve_generator_config(config.generator);
  if (!generator_config.has_value()) {
    std::cerr << "Error: " << generator_config.error() << "\n";
    return 1;
  }

  auto generator_result = core::SnowflakeGenerator::create(
      std::make_shared<core::SystemClock>(), generator_config.value());
  if (!generator_result.has_value()) {
    std::cerr << "Error: " << core::describe(generator_result.error()) << "\n";
    return 1;
  }
  const std::shared_ptr<core::SnowflakeGenerator> generator = generator_result.value();

  // ── Startup diagnostic block ──────────────────────────────────────────────
  const auto& gc = generator->config();
  std::cerr << "snowid server v" << core::kBuildVersion << "\n";
  std::cerr << "Coordinates: version=" << gc.version << " datacenter=" << gc.datacenter_id
            << " worker=" << gc.worker_id << " process=" << gc.process_id << "\n";
  std::cerr << "Sequence:    default=" << gc.default_sequence << "\n";
  std::cerr << "Clock:       system (milliseconds since Unix epoch)\n";
  if (server::has_all_zero_coordinates(gc)) {
    std::cerr << "WARNING: datacenter, worker and process ids are all 0.\n"
                 "         Any other default-configured instance produces colliding ids.\n"
                 "         Pass --config <file> or --datacenter/--worker/--process.\n";
  }
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  server::ServerContext ctx{*generator, gc, config};
  server::run_server_loop(ctx, std::cin, std::cout);

  return 0;
}
