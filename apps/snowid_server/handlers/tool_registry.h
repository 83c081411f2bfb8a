#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace snowid::server::handlers {

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& params, ServerContext& ctx)>;

// ToolDefinition is everything tools/list advertises plus the handler tools/call runs.
struct ToolDefinition {
  std::string name;             // NOLINT(readability-identifier-naming)
  std::string description;      // NOLINT(readability-identifier-naming)
  nlohmann::json input_schema;  // NOLINT(readability-identifier-naming)
  ToolHandler handler;          // NOLINT(readability-identifier-naming)
};

// build_tool_registry returns every tool in the order tools/list reports them.
std::vector<ToolDefinition> build_tool_registry();

// find_tool returns nullptr when no tool has this name.
const ToolDefinition* find_tool(const std::vector<ToolDefinition>& tools, std::string_view name);

}  // namespace snowid::server::handlers
