#include "decode_id.h"

#include "snowid/app/app_service.h"
#include "snowid/core/id128_codec.h"

#include <exception>
#include <string>

namespace snowid::server::handlers {

using json = nlohmann::json;

json handle_decode_id(const json& params, ServerContext& /*ctx*/) {
  try {
    const std::string text = params.at("id");
    const auto decoded = app::decode_id(text);

    if (!decoded.has_value()) {
      json error_result;
      error_result["error"] = "Cannot decode '" + text + "': " + core::describe(decoded.error());
      return error_result;
    }

    return core::id128_to_json(decoded.value());

  } catch (const std::exception& e) {
    json error_result;
    error_result["error"] = e.what();
    return error_result;
  }
}

}  // namespace snowid::server::handlers
