#include "tool_registry.h"

#include "decode_id.h"
#include "generate_id.h"
#include "generator_info.h"

namespace snowid::server::handlers {

using json = nlohmann::json;

std::vector<ToolDefinition> build_tool_registry() {
  std::vector<ToolDefinition> tools;

  tools.push_back({
      "generate_id",
      "Generate one or more 128-bit ids from this server's generator",
      {
          {"type", "object"},
          {"properties",
           {
               {"count", {{"type", "integer"}, {"description", "Number of ids (default 1)"}}},
               {"format",
                {{"type", "string"},
                 {"enum", json::array({"decimal", "hex", "json"})},
                 {"description", "Output form of each id (default decimal)"}}},
           }},
      },
      handle_generate_id,
  });

  tools.push_back({
      "decode_id",
      "Decode a 40-digit decimal or 32-character hex id into its fields",
      {
          {"type", "object"},
          {"properties", {{"id", {{"type", "string"}}}}},
          {"required", json::array({"id"})},
      },
      handle_decode_id,
  });

  tools.push_back({
      "generator_info",
      "Report this server's generator coordinates and per-millisecond capacity",
      {{"type", "object"}, {"properties", json::object()}},
      handle_generator_info,
  });

  return tools;
}

const ToolDefinition* find_tool(const std::vector<ToolDefinition>& tools,
                                const std::string_view name) {
  for (const auto& tool : tools) {
    if (tool.name == name) {
      return &tool;
    }
  }
  return nullptr;
}

}  // namespace snowid::server::handlers
