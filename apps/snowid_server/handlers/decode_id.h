#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace snowid::server::handlers {

// handle_decode_id: params {"id": "<40-digit decimal or 32-char hex>"}.
nlohmann::json handle_decode_id(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snowid::server::handlers
