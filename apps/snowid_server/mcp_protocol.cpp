#include "mcp_protocol.h"

#include <cstdint>
#include <string>

namespace snowid::server {

namespace {

nlohmann::json id_to_json(const std::optional<std::string>& id) {
  if (id.has_value()) {
    return id.value();
  }
  return nullptr;
}

}  // namespace

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error&) {
    return std::nullopt;
  }
  if (!json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  request.jsonrpc = json.value("jsonrpc", "2.0");

  if (json.contains("id")) {
    const auto& id = json["id"];
    if (id.is_string()) {
      request.id = id.get<std::string>();
    } else if (id.is_number_unsigned()) {
      request.id = std::to_string(id.get<std::uint64_t>());
    } else if (id.is_number_integer()) {
      request.id = std::to_string(id.get<std::int64_t>());
    }
  }

  if (json.contains("method") && json["method"].is_string()) {
    request.method = json["method"].get<std::string>();
  }
  if (json.contains("params") && json["params"].is_object()) {
    request.params = json["params"];
  } else {
    request.params = nlohmann::json::object();
  }

  return request;
}

std::string make_response(const std::optional<std::string>& id, const nlohmann::json& result) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_to_json(id);
  response["result"] = result;
  return response.dump();
}

std::string make_error_response(const std::optional<std::string>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id_to_json(id);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump();
}

}  // namespace snowid::server
