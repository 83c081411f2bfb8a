#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace snowid::core {

// Error vocabulary following E.14 (use purpose-designed types as error indicators).
// Each error carries enough data for a caller to decide whether a retry makes sense.

// ConfigField names the configuration input that failed validation.
enum class ConfigField {
  kVersion,
  kDatacenterId,
  kWorkerId,
  kProcessId,
  kDefaultSequence,
  kClock,
};

// ConfigError: a configuration value exceeds the width of its bit field.
// For kClock, value and max are both 0 (the clock handle was null).
struct ConfigError {
  ConfigField field;    // NOLINT(readability-identifier-naming)
  std::uint64_t value;  // NOLINT(readability-identifier-naming)
  std::uint64_t max;    // NOLINT(readability-identifier-naming)

  bool operator==(const ConfigError&) const = default;
};

enum class GenerateErrorKind {
  kClockRegression,    // clock returned a timestamp earlier than the last one used
  kSequenceExhausted,  // no sequence values left in the current millisecond
};

// GenerateError: a runtime refusal from SnowflakeGenerator::generate().
// by = milliseconds of regression (kClockRegression) or
//      stored sequence minus kMaxSequence (kSequenceExhausted).
// Generator state is unchanged whenever this error is returned.
struct GenerateError {
  GenerateErrorKind kind;  // NOLINT(readability-identifier-naming)
  std::uint64_t by;        // NOLINT(readability-identifier-naming)

  bool operator==(const GenerateError&) const = default;
};

enum class ParseError {
  kInvalidLength,
  kInvalidDigit,
  kOutOfRange,
};

[[nodiscard]] const char* to_string(ConfigField field);
[[nodiscard]] std::string describe(const ConfigError& error);
[[nodiscard]] std::string describe(const GenerateError& error);
[[nodiscard]] std::string describe(ParseError error);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace snowid::core
