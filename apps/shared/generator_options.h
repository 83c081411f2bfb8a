#pragma once

#include "snowid/core/generator_config.h"
#include "snowid/core/result.h"

#include "shared/arg_parser.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snowid::apps {

// GeneratorOptions collects the generator flags shared by snowid_cli and snowid_server.
// Per-field flags override the values loaded from --config.
struct GeneratorOptions {
  std::optional<std::string> config_path;         // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> version;           // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> datacenter_id;     // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> worker_id;         // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> process_id;        // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> default_sequence;  // NOLINT(readability-identifier-naming)
  bool args_valid{true};                          // NOLINT(readability-identifier-naming)
};

// append_generator_options adds --config, --version, --datacenter, --worker, --process and
// --default-sequence to an option registry. Config must expose `GeneratorOptions generator`.
// A non-numeric value is reported to stderr and clears generator.args_valid.
template <typename Config>
void append_generator_options(std::vector<Option<Config>>& options) {
  const auto numeric = [](const char* flag, std::optional<std::uint64_t> GeneratorOptions::*field) {
    return [flag, field](Config& c, const std::string& v) {
      const auto parsed = parse_uint64(v);
      if (!parsed.has_value()) {
        std::cerr << "Invalid " << flag << ": " << v << " (expected unsigned integer)\n";
        c.generator.args_valid = false;
        return false;
      }
      c.generator.*field = parsed;
      return true;
    };
  };

  options.push_back({"--config", true, "Path to generator config JSON file",
                     [](Config& c, const std::string& v) {
                       c.generator.config_path = v;
                       return true;
                     }});
  options.push_back({"--version", true, "Id version (0-15)",
                     numeric("--version", &GeneratorOptions::version)});
  options.push_back({"--datacenter", true, "Datacenter id (0-1023)",
                     numeric("--datacenter", &GeneratorOptions::datacenter_id)});
  options.push_back({"--worker", true, "Worker id (0-1023)",
                     numeric("--worker", &GeneratorOptions::worker_id)});
  options.push_back({"--process", true, "Process id (0-1023)",
                     numeric("--process", &GeneratorOptions::process_id)});
  options.push_back({"--default-sequence", true, "First sequence value of every millisecond",
                     numeric("--default-sequence", &GeneratorOptions::default_sequence)});
}

// resolve_generator_config loads --config (if given), applies per-field overrides and
// validates the result. Returns a printable error message on failure.
[[nodiscard]] core::Result<core::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorOptions& options);

}  // namespace snowid::apps
