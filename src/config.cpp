#include "dropshare/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace dropshare {

namespace {

std::optional<long long> parse_positive(const std::string& text) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(text, &used);
        if (used != text.size() || v <= 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<int> parse_port(const std::string& text) {
    auto v = parse_positive(text);
    if (!v || *v > 65535) return std::nullopt;
    return static_cast<int>(*v);
}

} // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

ServerConfig load_server_config(int argc, const char* const* argv, const EnvLookup& env) {
    ServerConfig cfg;

    if (auto level = env("DROPSHARE_LOG_LEVEL")) {
        if (!parse_log_level(*level, cfg.log_level))
            LOG_WARN("Unknown DROPSHARE_LOG_LEVEL '" << *level << "'. Using info");
    }

    if (auto port = env("PORT")) {
        if (auto p = parse_port(*port)) cfg.port = *p;
        else LOG_WARN("Invalid PORT '" << *port << "'. Using default " << DEFAULT_PORT);
    }

    if (auto payload = env("DROPSHARE_MAX_PAYLOAD")) {
        auto p = parse_positive(*payload);
        // uWS takes the limit as an unsigned int.
        if (p && static_cast<unsigned long long>(*p) <= std::numeric_limits<unsigned>::max())
            cfg.max_payload = static_cast<std::size_t>(*p);
        else LOG_WARN("Invalid DROPSHARE_MAX_PAYLOAD '" << *payload << "'. Using " << cfg.max_payload);
    }

    if (argc > 1) {
        if (auto p = parse_port(argv[1])) cfg.port = *p;
        else LOG_WARN("Invalid port argument. Using " << cfg.port);
    }
    return cfg;
}

} // namespace dropshare
