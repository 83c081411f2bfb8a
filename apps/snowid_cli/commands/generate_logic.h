#pragma once

#include "snowid/app/app_service.h"
#include "snowid/core/id_generator.h"

#include <optional>
#include <ostream>
#include <string>

// OutputFormat selects how generated ids are printed, one per line
// (kJson prints a single JSON array).
enum class OutputFormat {
  kDecimal,
  kHex,
  kJson,
  kDebug,
};

// parse_output_format maps "decimal" | "hex" | "json" | "debug" to OutputFormat.
[[nodiscard]] std::optional<OutputFormat> parse_output_format(const std::string& value);

// execute_generate: generate req.count ids and print them to out.
// Takes only interface types so tests can drive it with a ManualClock-backed generator.
// Returns 0 on success, 1 if the batch failed (error printed to stderr, nothing printed to out).
int execute_generate(const snowid::app::BatchRequest& req, snowid::core::IIdGenerator& id_gen,
                     OutputFormat format, std::ostream& out);
