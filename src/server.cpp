#include "dropshare/server.hpp"
#include "dropshare/health.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/relay.hpp"
#include "dropshare/utils.hpp"

#include <uWebSockets/App.h>

#include <csignal>
#include <cstring>
#include <string>
#include <unordered_map>
#include <vector>

namespace dropshare {

namespace {

struct PerSocketData {
    ConnectionId id;
};

using WebSocket = uWS::WebSocket<false, true, PerSocketData>;

class SocketOutbox : public Outbox {
public:
    void add(const ConnectionId& id, WebSocket* ws) { sockets_[id] = ws; }
    void remove(const ConnectionId& id) { sockets_.erase(id); }

    void send(const ConnectionId& to, const std::string& frame) override {
        auto it = sockets_.find(to);
        if (it == sockets_.end()) return;
        auto status = it->second->send(frame, uWS::OpCode::TEXT);
        if (status == WebSocket::BACKPRESSURE)
            LOG_DEBUG("Backpressure building on " << to << " (" << it->second->getBufferedAmount() << " bytes)");
        else if (status == WebSocket::DROPPED)
            LOG_WARN("Frame dropped for " << to);
    }

    void close_all() {
        // close() re-enters the close handler, which removes from the map.
        std::vector<WebSocket*> open;
        for (auto& kv : sockets_) open.push_back(kv.second);
        for (auto* ws : open) ws->close();
    }

private:
    std::unordered_map<ConnectionId, WebSocket*> sockets_;
};

SocketOutbox* global_outbox = nullptr;
us_timer_t* global_sweep_timer = nullptr;
us_listen_socket_t* global_listen_socket = nullptr;

void sigint_handler(int) {
    LOG_INFO("SIGINT received. Closing all connections...");
    if (global_sweep_timer) {
        us_timer_close(global_sweep_timer);
        global_sweep_timer = nullptr;
    }
    if (global_outbox) global_outbox->close_all();
    if (global_listen_socket) {
        us_listen_socket_close(0, global_listen_socket);
        global_listen_socket = nullptr;
    }
}

void sweep_timer_cb(us_timer_t* timer) {
    Relay* relay = nullptr;
    std::memcpy(&relay, us_timer_ext(timer), sizeof(relay));
    relay->sweep();
}

} // namespace

int run_server(const ServerConfig& config) {
    std::signal(SIGINT, sigint_handler);

    const auto started = std::chrono::steady_clock::now();
    SocketOutbox outbox;
    Relay relay(outbox, config);
    global_outbox = &outbox;

    uWS::App app;

    app.get(HEALTH_ENDPOINT, [started](auto* res, auto* /*req*/) {
        auto body = health_report(std::chrono::steady_clock::now() - started, resident_memory_bytes());
        res->writeHeader("Content-Type", "application/json")->end(body.dump());
    });

    app.get("/", [](auto* res, auto* /*req*/) {
        res->writeHeader("Content-Type", "text/plain")->end("dropshare relay\n");
    });

    app.ws<PerSocketData>(ENDPOINT, {
        .compression = uWS::DISABLED,
        .maxPayloadLength = static_cast<unsigned>(config.max_payload),
        .idleTimeout = static_cast<unsigned short>(config.idle_timeout_seconds),
        .open = [&outbox, &relay](auto* ws) {
            auto* ud = ws->getUserData();
            ud->id = random_connection_id();
            outbox.add(ud->id, ws);
            relay.on_open(ud->id);
        },
        .message = [&relay](auto* ws, std::string_view msg, uWS::OpCode op) {
            if (op != uWS::OpCode::TEXT) {
                LOG_WARN("Ignoring binary frame from " << ws->getUserData()->id);
                return;
            }
            relay.on_message(ws->getUserData()->id, msg);
        },
        .close = [&outbox, &relay](auto* ws, int /*code*/, std::string_view /*message*/) {
            auto* ud = ws->getUserData();
            outbox.remove(ud->id);
            relay.on_close(ud->id);
        }
    }).listen(config.port, [&config](auto* listen_socket) {
        if (listen_socket) {
            global_listen_socket = listen_socket;
            LOG_INFO("Listening on ws://localhost:" << config.port << ENDPOINT << " (health at " << HEALTH_ENDPOINT << ")");
            if (auto lan = lan_ipv4_address()) LOG_INFO("Network: ws://" << *lan << ":" << config.port << ENDPOINT);
            else LOG_WARN("No LAN IPv4 address found. Other devices cannot reach this host");
        } else {
            LOG_ERROR("Failed to listen on port " << config.port);
        }
    });

    if (!global_listen_socket) {
        global_outbox = nullptr;
        return 1;
    }

    auto cleanup_ms = static_cast<int>(config.cleanup_interval.count());
    global_sweep_timer = us_create_timer(reinterpret_cast<us_loop_t*>(uWS::Loop::get()), 0, sizeof(Relay*));
    Relay* relay_ptr = &relay;
    std::memcpy(us_timer_ext(global_sweep_timer), &relay_ptr, sizeof(relay_ptr));
    us_timer_set(global_sweep_timer, sweep_timer_cb, cleanup_ms, cleanup_ms);

    app.run();

    global_outbox = nullptr;
    LOG_INFO("Relay stopped");
    return 0;
}

} // namespace dropshare
