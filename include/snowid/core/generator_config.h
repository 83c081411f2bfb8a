#pragma once

#include "snowid/core/result.h"

#include <cstdint>
#include <string>

namespace snowid::core {

// GeneratorConfig is the complete externally supplied configuration of a generator.
// Uniqueness across generator instances relies on disjoint coordinates
// (version, datacenter_id, worker_id, process_id); nothing else coordinates instances.
//
// default_sequence is the sequence value used for the first id of every millisecond.
struct GeneratorConfig {
  std::uint64_t version{0};           // NOLINT(readability-identifier-naming)
  std::uint64_t datacenter_id{0};     // NOLINT(readability-identifier-naming)
  std::uint64_t worker_id{0};         // NOLINT(readability-identifier-naming)
  std::uint64_t process_id{0};        // NOLINT(readability-identifier-naming)
  std::uint64_t default_sequence{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const GeneratorConfig&) const = default;
};

// validate_generator_config checks every field against its Id128 bit width.
// Returns the config unchanged on success, or the first offending field
// (checked in order: version, datacenter_id, worker_id, process_id, default_sequence).
[[nodiscard]] Result<GeneratorConfig, ConfigError> validate_generator_config(
    const GeneratorConfig& config);

// generator_config_to_json serializes to a JSON string with alphabetically sorted keys.
[[nodiscard]] std::string generator_config_to_json(const GeneratorConfig& config);

// generator_config_from_json parses the JSON file form:
//   {"version": 1, "datacenter_id": 2, "worker_id": 3, "process_id": 4, "default_sequence": 0}
// default_sequence is optional (0). No range validation is done here.
// Throws std::runtime_error if the input is not valid JSON, a required field is absent,
// or a field is not an unsigned integer.
[[nodiscard]] GeneratorConfig generator_config_from_json(const std::string& json_str);

}  // namespace snowid::core
