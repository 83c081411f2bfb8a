#include "shared/generator_options.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace snowid::apps {

core::Result<core::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorOptions& options) {
  using R = core::Result<core::GeneratorConfig, std::string>;

  core::GeneratorConfig config;

  if (options.config_path.has_value()) {
    std::ifstream file(options.config_path.value());
    if (!file) {
      return R::err("Cannot open config file: " + options.config_path.value());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    try {
      config = core::generator_config_from_json(contents.str());
    } catch (const std::runtime_error& e) {
      return R::err(options.config_path.value() + ": " + e.what());
    }
  }

  if (options.version.has_value()) {
    config.version = options.version.value();
  }
  if (options.datacenter_id.has_value()) {
    config.datacenter_id = options.datacenter_id.value();
  }
  if (options.worker_id.has_value()) {
    config.worker_id = options.worker_id.value();
  }
  if (options.process_id.has_value()) {
    config.process_id = options.process_id.value();
  }
  if (options.default_sequence.has_value()) {
    config.default_sequence = options.default_sequence.value();
  }

  const auto validated = core::validate_generator_config(config);
  if (!validated.has_value()) {
    return R::err(core::describe(validated.error()));
  }
  return R::ok(validated.value());
}

}  // namespace snowid::apps
