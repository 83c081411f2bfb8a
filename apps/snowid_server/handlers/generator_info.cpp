#include "generator_info.h"

#include "snowid/app/app_service.h"

namespace snowid::server::handlers {

nlohmann::json handle_generator_info(const nlohmann::json& /*params*/, ServerContext& ctx) {
  return app::generator_info_to_json(ctx.generator_config);
}

}  // namespace snowid::server::handlers
