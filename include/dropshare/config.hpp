#pragma once
#include "types.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace dropshare {

struct ServerConfig {
    int port = DEFAULT_PORT;
    LogLevel log_level = LogLevel::Info;
    std::size_t max_payload = MAX_CLIENT_MSG;
    unsigned idle_timeout_seconds = IDLE_TIMEOUT_SECONDS;
    std::size_t max_room_size = MAX_ROOM_SIZE;
    std::size_t max_joins_per_window = MAX_JOINS_PER_WINDOW;
    std::chrono::milliseconds rate_limit_window = RATE_LIMIT_WINDOW;
    std::chrono::milliseconds cleanup_interval = ROOM_CLEANUP_INTERVAL;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> process_env(const std::string& name);

// Defaults, then PORT / DROPSHARE_LOG_LEVEL / DROPSHARE_MAX_PAYLOAD, then argv[1] as the port.
// Bad values are logged and ignored.
ServerConfig load_server_config(int argc, const char* const* argv, const EnvLookup& env = process_env);

} // namespace dropshare
