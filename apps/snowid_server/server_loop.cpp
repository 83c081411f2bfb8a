#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <exception>
#include <iostream>
#include <string>

namespace snowid::server {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  const auto method_registry = build_method_registry();

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    if (is_notification(request)) {
      std::cerr << "Notification: " << request.method << "\n";
      continue;
    }
    std::cerr << "Received: " << request.method << "\n";

    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      out << make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method)
          << "\n"
          << std::flush;
      continue;
    }

    try {
      const json result = it->second(request, ctx);
      out << make_response(request.id, result) << "\n" << std::flush;
    } catch (const std::exception& e) {
      out << make_error_response(request.id, kInternalError, e.what()) << "\n" << std::flush;
    }
  }

  std::cerr << "snowid server shutting down\n";
}

}  // namespace snowid::server
