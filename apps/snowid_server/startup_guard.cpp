#include "startup_guard.h"

namespace snowid::server {

std::string validate_server_config(const ServerConfig& config) {
  if (!config.args_valid || !config.generator.args_valid) {
    return "Error: invalid command-line arguments (see messages above).";
  }

  if (config.require_coordinates && !config.generator.config_path.has_value()) {
    const auto& g = config.generator;
    if (!g.datacenter_id.has_value() || !g.worker_id.has_value() || !g.process_id.has_value()) {
      return "Error: --require-coordinates is set but coordinates are incomplete.\n"
             "       Pass --config <file>, or all of --datacenter, --worker and --process.\n"
             "       Ids are only unique across instances with disjoint coordinates.";
    }
  }

  return "";
}

bool has_all_zero_coordinates(const core::GeneratorConfig& config) {
  return config.datacenter_id == 0 && config.worker_id == 0 && config.process_id == 0;
}

}  // namespace snowid::server
