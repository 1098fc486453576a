#pragma once
#include "config.hpp"

namespace dropshare {

// Runs the WebSocket relay and the /health endpoint until SIGINT. Returns the exit code.
int run_server(const ServerConfig& config);

} // namespace dropshare
