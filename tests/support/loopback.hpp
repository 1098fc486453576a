#pragma once
#include "manual_scheduler.hpp"

#include "dropshare/client/transfer_client.hpp"
#include "dropshare/relay.hpp"
#include "dropshare/utils.hpp"

#include <map>
#include <memory>
#include <string>

namespace dropshare::testing {

// Relay and clients in one process. Every hop is queued on the scheduler at zero delay, so
// frames stay in order per direction and nothing is delivered re-entrantly.
class LoopbackNetwork : public Outbox {
public:
    class Device : public client::EventChannel {
    public:
        Device(LoopbackNetwork& net, std::string name, client::TransferConfig config)
            : net_(net), name_(std::move(name)), client_(*this, net.scheduler_, config) {}

        void emit(const std::string& event, const nlohmann::json& data) override {
            if (!up_) return;
            std::string frame = make_frame(event, data);
            ConnectionId from = id_;
            net_.scheduler_.schedule(std::chrono::milliseconds(0), [this, from, frame] {
                if (up_ && id_ == from) net_.relay_.on_message(from, frame);
            });
        }
        bool connected() const override { return up_; }
        void reconnect() override { ++reconnects; }

        client::TransferClient& client() { return client_; }
        const ConnectionId& connection_id() const { return id_; }
        const std::string& name() const { return name_; }

        int reconnects = 0;

    private:
        friend class LoopbackNetwork;
        LoopbackNetwork& net_;
        std::string name_;
        ConnectionId id_;
        bool up_ = false;
        client::TransferClient client_;
    };

    explicit LoopbackNetwork(ManualScheduler& scheduler, ServerConfig config = {})
        : scheduler_(scheduler), relay_(*this, config) {}

    Device& add(const std::string& name, client::TransferConfig config = {}) {
        auto device = std::make_unique<Device>(*this, name, config);
        auto& ref = *device;
        devices_.push_back(std::move(device));
        return ref;
    }

    void connect(Device& d) {
        d.id_ = name_prefix(d) + std::to_string(++sessions_);
        d.up_ = true;
        by_id_[d.id_] = &d;
        relay_.on_open(d.id_);
        d.client_.on_connected();
    }

    void disconnect(Device& d) {
        if (!d.up_) return;
        d.up_ = false;
        by_id_.erase(d.id_);
        relay_.on_close(d.id_);
        d.client_.on_disconnected();
    }

    void send(const ConnectionId& to, const std::string& frame) override {
        auto it = by_id_.find(to);
        if (it == by_id_.end()) return;
        Device* d = it->second;
        scheduler_.schedule(std::chrono::milliseconds(0), [d, to, frame] {
            if (d->up_ && d->id_ == to) d->client_.handle_frame(frame);
        });
    }

    Relay& relay() { return relay_; }

private:
    static std::string name_prefix(const Device& d) { return d.name() + "-"; }

    ManualScheduler& scheduler_;
    Relay relay_;
    std::vector<std::unique_ptr<Device>> devices_;
    std::map<ConnectionId, Device*> by_id_;
    int sessions_ = 0;
};

} // namespace dropshare::testing
