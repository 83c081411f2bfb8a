#include "snowid/core/generator_config.h"

#include "snowid/core/id128.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace snowid::core {

namespace {

using json = nlohmann::json;

std::uint64_t read_unsigned(const json& j, const char* key) {
  if (!j.contains(key)) {
    throw std::runtime_error(std::string("Missing required field: ") + key);
  }
  const json& value = j.at(key);
  if (!value.is_number_unsigned()) {
    throw std::runtime_error(std::string("Field must be an unsigned integer: ") + key);
  }
  return value.get<std::uint64_t>();
}

}  // namespace

Result<GeneratorConfig, ConfigError> validate_generator_config(const GeneratorConfig& config) {
  using R = Result<GeneratorConfig, ConfigError>;

  if (config.version > Id128::kMaxVersion) {
    return R::err(ConfigError{ConfigField::kVersion, config.version, Id128::kMaxVersion});
  }
  if (config.datacenter_id > Id128::kMaxDatacenterId) {
    return R::err(
        ConfigError{ConfigField::kDatacenterId, config.datacenter_id, Id128::kMaxDatacenterId});
  }
  if (config.worker_id > Id128::kMaxWorkerId) {
    return R::err(ConfigError{ConfigField::kWorkerId, config.worker_id, Id128::kMaxWorkerId});
  }
  if (config.process_id > Id128::kMaxProcessId) {
    return R::err(ConfigError{ConfigField::kProcessId, config.process_id, Id128::kMaxProcessId});
  }
  // default_sequence == kMaxSequence is a legal configuration; every generate() call
  // on such a generator reports kSequenceExhausted.
  if (config.default_sequence > Id128::kMaxSequence) {
    return R::err(ConfigError{ConfigField::kDefaultSequence, config.default_sequence,
                              Id128::kMaxSequence});
  }
  return R::ok(config);
}

std::string generator_config_to_json(const GeneratorConfig& config) {
  json j;
  j["datacenter_id"] = config.datacenter_id;
  j["default_sequence"] = config.default_sequence;
  j["process_id"] = config.process_id;
  j["version"] = config.version;
  j["worker_id"] = config.worker_id;
  return j.dump();
}

GeneratorConfig generator_config_from_json(const std::string& json_str) {
  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid generator config JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("Generator config must be a JSON object");
  }

  GeneratorConfig config;
  config.version = read_unsigned(j, "version");
  config.datacenter_id = read_unsigned(j, "datacenter_id");
  config.worker_id = read_unsigned(j, "worker_id");
  config.process_id = read_unsigned(j, "process_id");
  if (j.contains("default_sequence")) {
    config.default_sequence = read_unsigned(j, "default_sequence");
  }
  return config;
}

}  // namespace snowid::core
