#pragma once

#include "snowid/core/generator_config.h"
#include "snowid/core/id_generator.h"

#include "config.h"

namespace snowid::server {

// ServerContext holds all process-lifetime references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  core::IIdGenerator& id_gen;                     // NOLINT(readability-identifier-naming)
  const core::GeneratorConfig& generator_config;  // NOLINT(readability-identifier-naming)
  const ServerConfig& config;                     // NOLINT(readability-identifier-naming)
};

}  // namespace snowid::server
