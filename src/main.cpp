#include "dropshare/config.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/server.hpp"

#include <exception>

int main(int argc, char* argv[]) {
    try {
        auto config = dropshare::load_server_config(argc, argv);
        dropshare::set_log_level(config.log_level);
        return dropshare::run_server(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Relay terminated: " << e.what());
        return 1;
    }
}
