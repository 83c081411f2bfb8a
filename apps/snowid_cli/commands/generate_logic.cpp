#include "generate_logic.h"

#include "snowid/core/id128_codec.h"

#include <nlohmann/json.hpp>

#include <iostream>

std::optional<OutputFormat> parse_output_format(const std::string& value) {
  if (value == "decimal") {
    return OutputFormat::kDecimal;
  }
  if (value == "hex") {
    return OutputFormat::kHex;
  }
  if (value == "json") {
    return OutputFormat::kJson;
  }
  if (value == "debug") {
    return OutputFormat::kDebug;
  }
  return std::nullopt;
}

int execute_generate(const snowid::app::BatchRequest& req, snowid::core::IIdGenerator& id_gen,
                     const OutputFormat format, std::ostream& out) {
  const auto batch = snowid::app::generate_batch(req, id_gen);
  if (!batch.has_value()) {
    std::cerr << "Error: " << snowid::core::describe(batch.error()) << "\n";
    return 1;
  }

  const auto& ids = batch.value();
  switch (format) {
    case OutputFormat::kDecimal:
      for (const auto& id : ids) {
        out << snowid::core::to_decimal_string(id) << "\n";
      }
      break;
    case OutputFormat::kHex:
      for (const auto& id : ids) {
        out << snowid::core::to_hex_string(id) << "\n";
      }
      break;
    case OutputFormat::kDebug:
      for (const auto& id : ids) {
        out << id << "\n";
      }
      break;
    case OutputFormat::kJson: {
      nlohmann::json arr = nlohmann::json::array();
      for (const auto& id : ids) {
        arr.push_back(snowid::core::id128_to_json(id));
      }
      out << arr.dump(2) << "\n";
      break;
    }
  }
  return 0;
}
