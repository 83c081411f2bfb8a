#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace snowid::server {

// MethodHandler computes the "result" member of a JSON-RPC response.
// Throwing turns the response into an internal error.
using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;
using MethodRegistry = std::unordered_map<std::string, MethodHandler>;

// MCP methods
nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_ping(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

MethodRegistry build_method_registry();

// is_notification: a request without an id. Notifications never get a response.
[[nodiscard]] bool is_notification(const JsonRpcRequest& req);

}  // namespace snowid::server
