#pragma once

#include "shared/generator_options.h"
#include <cstddef>

namespace snowid::server {

// ServerConfig holds all parsed startup flags for snowid_server.
// Every field has an explicit default; optional generator fields mean "not configured".
struct ServerConfig {
  apps::GeneratorOptions generator;  // NOLINT(readability-identifier-naming)
  // Refuse to start unless coordinates come from --config or all of
  // --datacenter/--worker/--process. Guards against fleets of default (0,0,0) instances.
  bool require_coordinates{false};  // NOLINT(readability-identifier-naming)
  // Upper bound on the "count" argument of a single generate_id call.
  std::size_t max_batch{10000};  // NOLINT(readability-identifier-naming)
  bool args_valid{true};         // NOLINT(readability-identifier-naming)
};

ServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace snowid::server
