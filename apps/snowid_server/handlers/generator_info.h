#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace snowid::server::handlers {

nlohmann::json handle_generator_info(const nlohmann::json& params, ServerContext& ctx);

}  // namespace snowid::server::handlers
