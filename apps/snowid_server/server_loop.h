#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>

namespace snowid::server {

// run_server_loop reads one JSON-RPC request per line from in and writes one response
// per line to out until in reaches EOF. Blank lines are skipped, and notifications
// (requests without an id) are logged to stderr but never answered.
void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace snowid::server
