#pragma once

#include "snowid/core/generator_config.h"
#include "snowid/core/id128.h"
#include "snowid/core/id_generator.h"
#include "snowid/core/result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace snowid::app {

// ────────────────────────────────────────────────────────────────
// Batch Generation
// ────────────────────────────────────────────────────────────────

// BatchRequest asks for count ids from one generator in a single call.
struct BatchRequest {
  std::size_t count{1};  // NOLINT(readability-identifier-naming)
};

// generate_batch returns exactly req.count ids in generation order, or the first
// GenerateError. Ids generated before the error are discarded. No retries: both
// failure kinds are the caller's to handle.
[[nodiscard]] core::Result<std::vector<core::Id128>, core::GenerateError> generate_batch(
    const BatchRequest& req, core::IIdGenerator& id_gen);

// ────────────────────────────────────────────────────────────────
// Decoding
// ────────────────────────────────────────────────────────────────

// decode_id accepts either textual form: 40-digit decimal or 32-character hex.
// Any other length is kInvalidLength.
[[nodiscard]] core::Result<core::Id128, core::ParseError> decode_id(std::string_view text);

// ────────────────────────────────────────────────────────────────
// Introspection
// ────────────────────────────────────────────────────────────────

// ids_per_millisecond: how many ids one generator with this config can issue per millisecond,
// sequence values default_sequence through kMaxSequence inclusive (0 when
// default_sequence == kMaxSequence).
[[nodiscard]] std::uint64_t ids_per_millisecond(const core::GeneratorConfig& config);

// generator_info_to_json: configuration plus derived capacity, keys sorted.
[[nodiscard]] nlohmann::json generator_info_to_json(const core::GeneratorConfig& config);

}  // namespace snowid::app
