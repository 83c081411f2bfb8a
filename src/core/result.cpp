#include "snowid/core/result.h"

namespace snowid::core {

const char* to_string(const ConfigField field) {
  switch (field) {
    case ConfigField::kVersion:
      return "version";
    case ConfigField::kDatacenterId:
      return "datacenter_id";
    case ConfigField::kWorkerId:
      return "worker_id";
    case ConfigField::kProcessId:
      return "process_id";
    case ConfigField::kDefaultSequence:
      return "default_sequence";
    case ConfigField::kClock:
      return "clock";
  }
  return "unknown";
}

std::string describe(const ConfigError& error) {
  if (error.field == ConfigField::kClock) {
    return "Invalid configuration: clock must not be null";
  }
  return std::string("Invalid configuration: ") + to_string(error.field) + " = " +
         std::to_string(error.value) + " exceeds maximum " + std::to_string(error.max);
}

std::string describe(const GenerateError& error) {
  switch (error.kind) {
    case GenerateErrorKind::kClockRegression:
      return "Clock moved backwards. Refusing to generate id for " + std::to_string(error.by) +
             " milliseconds";
    case GenerateErrorKind::kSequenceExhausted:
      return "Sequence exhausted. Refusing to generate id for " + std::to_string(error.by) +
             " increments";
  }
  return "Unknown generate error";
}

std::string describe(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidLength:
      return "Invalid length";
    case ParseError::kInvalidDigit:
      return "Invalid digit";
    case ParseError::kOutOfRange:
      return "Value out of range";
  }
  return "Unknown parse error";
}

}  // namespace snowid::core
