#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace snowid::server::handlers {

// handle_generate_id: params {"count": N (default 1), "format": "decimal"|"hex"|"json"}.
// Result {"ids": [...]} or {"error": msg} ({"error_kind", "by"} added for generator refusals).
nlohmann::json handle_generate_id(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snowid::server::handlers
