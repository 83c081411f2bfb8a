#include "snowid/app/app_service.h"

#include "snowid/core/id128_codec.h"

#include <utility>

namespace snowid::app {

core::Result<std::vector<core::Id128>, core::GenerateError> generate_batch(
    const BatchRequest& req, core::IIdGenerator& id_gen) {
  using R = core::Result<std::vector<core::Id128>, core::GenerateError>;

  std::vector<core::Id128> ids;
  ids.reserve(req.count);

  while (ids.size() < req.count) {
    auto result = id_gen.generate();
    if (!result.has_value()) {
      return R::err(result.error());
    }
    ids.push_back(result.value());
  }

  return R::ok(std::move(ids));
}

core::Result<core::Id128, core::ParseError> decode_id(const std::string_view text) {
  if (text.size() == core::kId128DecimalLength) {
    return core::parse_decimal_string(text);
  }
  if (text.size() == core::kId128HexLength) {
    return core::parse_hex_string(text);
  }
  return core::Result<core::Id128, core::ParseError>::err(core::ParseError::kInvalidLength);
}

std::uint64_t ids_per_millisecond(const core::GeneratorConfig& config) {
  // The stored sequence is checked before it is used, so kMaxSequence as the
  // starting value fails on the first call.
  if (config.default_sequence >= core::Id128::kMaxSequence) {
    return 0;
  }
  return core::Id128::kMaxSequence - config.default_sequence + 1;
}

nlohmann::json generator_info_to_json(const core::GeneratorConfig& config) {
  nlohmann::json j;
  j["datacenter_id"] = config.datacenter_id;
  j["default_sequence"] = config.default_sequence;
  j["ids_per_millisecond"] = ids_per_millisecond(config);
  j["process_id"] = config.process_id;
  j["version"] = config.version;
  j["worker_id"] = config.worker_id;
  return j;
}

}  // namespace snowid::app
