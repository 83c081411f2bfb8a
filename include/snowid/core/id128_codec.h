#pragma once

#include "snowid/core/id128.h"
#include "snowid/core/result.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace snowid::core {

// Serialized forms of Id128. Every form keeps word0 and word1 verbatim, word0 first,
// so identifiers stay bit-exact across processes.

constexpr std::size_t kId128ByteLength = 16;
constexpr std::size_t kId128DecimalLength = 40;
constexpr std::size_t kId128HexLength = 32;

// to_bytes: word0 big-endian (bytes 0..7) followed by word1 big-endian (bytes 8..15).
[[nodiscard]] std::array<std::uint8_t, kId128ByteLength> to_bytes(const Id128& id);

// from_bytes: inverse of to_bytes. Fails with kInvalidLength unless exactly 16 bytes.
[[nodiscard]] Result<Id128, ParseError> from_bytes(std::span<const std::uint8_t> bytes);

// to_decimal_string: 40 characters, word0 then word1, each zero-padded to 20 digits.
// Example: word0 = 15000, word1 = 7 -> "00000000000000015000" "00000000000000000007"
[[nodiscard]] std::string to_decimal_string(const Id128& id);

// parse_decimal_string: inverse of to_decimal_string.
// Rejects: length != 40 (kInvalidLength), non-digit characters (kInvalidDigit),
//          a 20-digit half above UINT64_MAX (kOutOfRange).
[[nodiscard]] Result<Id128, ParseError> parse_decimal_string(std::string_view text);

// to_hex_string: the 16 bytes of to_bytes as 32 lower-case hex characters.
[[nodiscard]] std::string to_hex_string(const Id128& id);

// parse_hex_string: inverse of to_hex_string; upper-case digits are accepted.
// Rejects: length != 32 (kInvalidLength), non-hex characters (kInvalidDigit).
[[nodiscard]] Result<Id128, ParseError> parse_hex_string(std::string_view text);

// to_debug_string renders the decoded fields for logs and diagnostics:
// "Id128(version=5, timestamp_ms=15000, datacenter_id=123, worker_id=456, process_id=789,
//  sequence=12345)"
[[nodiscard]] std::string to_debug_string(const Id128& id);

std::ostream& operator<<(std::ostream& os, const Id128& id);

// Deterministic JSON serialization (keys sorted; nlohmann::json uses std::map internally).
// Contains both raw words, the 40-digit "id" string, the "hex" string and every decoded field.
[[nodiscard]] nlohmann::json id128_to_json(const Id128& id);

// Deserialize from JSON. Only "word0" and "word1" are read; the remaining keys are derived.
// Throws nlohmann::json::exception on missing fields or type mismatches.
[[nodiscard]] Id128 id128_from_json(const nlohmann::json& j);

}  // namespace snowid::core
