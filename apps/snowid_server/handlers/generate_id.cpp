#include "generate_id.h"

#include "snowid/app/app_service.h"
#include "snowid/core/id128_codec.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>

namespace snowid::server::handlers {

using json = nlohmann::json;

namespace {

const char* error_kind_name(const core::GenerateErrorKind kind) {
  switch (kind) {
    case core::GenerateErrorKind::kClockRegression:
      return "clock_regression";
    case core::GenerateErrorKind::kSequenceExhausted:
      return "sequence_exhausted";
  }
  return "unknown";
}

}  // namespace

json handle_generate_id(const json& params, ServerContext& ctx) {
  try {
    if (params.contains("count") && !params.at("count").is_number_unsigned()) {
      json error_result;
      error_result["error"] = "count must be a positive integer";
      return error_result;
    }
    const auto count = params.value("count", std::uint64_t{1});
    const std::string format = params.value("format", std::string{"decimal"});

    if (count == 0 || count > ctx.config.max_batch) {
      json error_result;
      error_result["error"] =
          "count must be between 1 and " + std::to_string(ctx.config.max_batch);
      return error_result;
    }
    if (format != "decimal" && format != "hex" && format != "json") {
      json error_result;
      error_result["error"] = "Unknown format: " + format + " (valid: decimal, hex, json)";
      return error_result;
    }

    const app::BatchRequest req{.count = static_cast<std::size_t>(count)};
    const auto batch = app::generate_batch(req, ctx.id_gen);
    if (!batch.has_value()) {
      json error_result;
      error_result["error"] = core::describe(batch.error());
      error_result["error_kind"] = error_kind_name(batch.error().kind);
      error_result["by"] = batch.error().by;
      return error_result;
    }

    json result;
    result["ids"] = json::array();
    for (const auto& id : batch.value()) {
      if (format == "json") {
        result["ids"].push_back(core::id128_to_json(id));
      } else if (format == "hex") {
        result["ids"].push_back(core::to_hex_string(id));
      } else {
        result["ids"].push_back(core::to_decimal_string(id));
      }
    }
    return result;

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace snowid::server::handlers
