#include "method_handlers.h"

#include "snowid/core/version.h"

#include "handlers/tool_registry.h"
#include <string>
#include <vector>

namespace snowid::server {

using json = nlohmann::json;

namespace {

const std::vector<handlers::ToolDefinition>& tools() {
  static const auto registry = handlers::build_tool_registry();
  return registry;
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", "snowid"}, {"version", core::kBuildVersion}}},
  };
}

json handle_ping(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json::object();
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  json list = json::array();
  for (const auto& tool : tools()) {
    list.push_back({
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
    });
  }
  return json{{"tools", list}};
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const std::string tool_name = req.params.value("name", "");
  const json tool_params = req.params.value("arguments", json::object());

  const handlers::ToolDefinition* tool = handlers::find_tool(tools(), tool_name);
  if (tool == nullptr) {
    json error_result;
    error_result["error"] = "Unknown tool: " + tool_name;
    return error_result;
  }

  return tool->handler(tool_params, ctx);
}

MethodRegistry build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"ping", handle_ping},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

bool is_notification(const JsonRpcRequest& req) {
  return !req.id.has_value();
}

}  // namespace snowid::server
