#include "snowid/core/id128_codec.h"

#include <iomanip>
#include <limits>
#include <sstream>

namespace snowid::core {

namespace {

constexpr int kWordDigits = 20;

void write_be64(const std::uint64_t word, std::uint8_t* out) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(word >> (56 - 8 * i));  // NOLINT
  }
}

std::uint64_t read_be64(std::span<const std::uint8_t> in) {
  std::uint64_t word = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    word = (word << 8) | static_cast<std::uint64_t>(in[i]);
  }
  return word;
}

// Parses exactly 20 decimal digits. Caller has already checked the characters are digits.
Result<std::uint64_t, ParseError> parse_word(std::string_view digits) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  std::uint64_t value = 0;
  for (const char ch : digits) {
    const auto digit = static_cast<std::uint64_t>(ch - '0');
    if (value > (kMax - digit) / 10) {
      return Result<std::uint64_t, ParseError>::err(ParseError::kOutOfRange);
    }
    value = value * 10 + digit;
  }
  return Result<std::uint64_t, ParseError>::ok(value);
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::array<std::uint8_t, kId128ByteLength> to_bytes(const Id128& id) {
  std::array<std::uint8_t, kId128ByteLength> bytes{};
  write_be64(id.word0(), bytes.data());
  write_be64(id.word1(), bytes.data() + 8);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return bytes;
}

Result<Id128, ParseError> from_bytes(const std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kId128ByteLength) {
    return Result<Id128, ParseError>::err(ParseError::kInvalidLength);
  }
  return Result<Id128, ParseError>::ok(
      Id128::from_words(read_be64(bytes.first(8)), read_be64(bytes.subspan(8, 8))));
}

std::string to_decimal_string(const Id128& id) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(kWordDigits) << id.word0() << std::setw(kWordDigits)
      << id.word1();
  return oss.str();
}

Result<Id128, ParseError> parse_decimal_string(const std::string_view text) {
  if (text.size() != kId128DecimalLength) {
    return Result<Id128, ParseError>::err(ParseError::kInvalidLength);
  }
  for (const char ch : text) {
    if (ch < '0' || ch > '9') {
      return Result<Id128, ParseError>::err(ParseError::kInvalidDigit);
    }
  }

  const auto word0 = parse_word(text.substr(0, kWordDigits));
  if (!word0.has_value()) {
    return Result<Id128, ParseError>::err(word0.error());
  }
  const auto word1 = parse_word(text.substr(kWordDigits));
  if (!word1.has_value()) {
    return Result<Id128, ParseError>::err(word1.error());
  }

  return Result<Id128, ParseError>::ok(Id128::from_words(word0.value(), word1.value()));
}

std::string to_hex_string(const Id128& id) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(kId128HexLength);
  for (const std::uint8_t byte : to_bytes(id)) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

Result<Id128, ParseError> parse_hex_string(const std::string_view text) {
  if (text.size() != kId128HexLength) {
    return Result<Id128, ParseError>::err(ParseError::kInvalidLength);
  }

  std::array<std::uint8_t, kId128ByteLength> bytes{};
  for (std::size_t i = 0; i < kId128ByteLength; ++i) {
    const int hi = hex_value(text[2 * i]);
    const int lo = hex_value(text[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return Result<Id128, ParseError>::err(ParseError::kInvalidDigit);
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return from_bytes(bytes);
}

std::string to_debug_string(const Id128& id) {
  std::ostringstream oss;
  oss << "Id128(version=" << id.version() << ", timestamp_ms=" << id.timestamp_ms()
      << ", datacenter_id=" << id.datacenter_id() << ", worker_id=" << id.worker_id()
      << ", process_id=" << id.process_id() << ", sequence=" << id.sequence() << ")";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Id128& id) {
  return os << to_debug_string(id);
}

nlohmann::json id128_to_json(const Id128& id) {
  nlohmann::json j;
  j["datacenter_id"] = id.datacenter_id();
  j["hex"] = to_hex_string(id);
  j["id"] = to_decimal_string(id);
  j["process_id"] = id.process_id();
  j["sequence"] = id.sequence();
  j["timestamp_ms"] = id.timestamp_ms();
  j["version"] = id.version();
  j["word0"] = id.word0();
  j["word1"] = id.word1();
  j["worker_id"] = id.worker_id();
  return j;
}

Id128 id128_from_json(const nlohmann::json& j) {
  return Id128::from_words(j.at("word0").get<std::uint64_t>(),
                           j.at("word1").get<std::uint64_t>());
}

}  // namespace snowid::core
