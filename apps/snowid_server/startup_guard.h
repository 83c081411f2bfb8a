#pragma once

#include "config.h"
#include <string>

namespace snowid::server {

// validate_server_config checks startup preconditions that do not need I/O.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag value parsed (no invalid numeric values)
// - with --require-coordinates: --config is given, or all of --datacenter, --worker
//   and --process are given
//
// Range checks and config-file loading happen afterwards in resolve_generator_config().
[[nodiscard]] std::string validate_server_config(const ServerConfig& config);

// has_all_zero_coordinates is true when datacenter, worker and process ids are all 0,
// which makes this instance indistinguishable from any other default-configured one.
[[nodiscard]] bool has_all_zero_coordinates(const core::GeneratorConfig& config);

}  // namespace snowid::server
