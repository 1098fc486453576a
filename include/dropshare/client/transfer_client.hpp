#pragma once
#include "channel.hpp"
#include "chunk_source.hpp"
#include "receiver.hpp"
#include "resilience.hpp"
#include "sender.hpp"
#include "transfer_config.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace dropshare::client {

// One device's view of the relay: room membership, outgoing and incoming transfers,
// connection health. Feed it every frame the channel delivers and the channel's
// connect/disconnect transitions.
class TransferClient {
public:
    using SendFinishedFn = std::function<void(const SenderPipeline&)>;

    TransferClient(EventChannel& channel, Scheduler& scheduler, TransferConfig config = {});
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    void handle_frame(std::string_view raw);
    void handle_event(const std::string& event, const nlohmann::json& data);

    void on_connected();
    void on_disconnected();

    void join_room(const std::string& raw_code);
    // Joins a freshly generated code and returns it.
    std::string create_room();
    void leave_room();

    // Starts streaming to everyone currently in the room. Returns the file id.
    // Throws std::invalid_argument for a file over max_file_size or with a blocked extension,
    // std::logic_error when not in a room or nobody else is there.
    std::string send_file(std::unique_ptr<ChunkSource> source, const std::string& file_name,
                          const std::string& mime_type);

    // Millisecond timestamp plus a random suffix, so two sends in the same instant differ.
    std::string generate_file_id() const;

    const ConnectionId& id() const { return id_; }
    const std::optional<std::string>& room() const { return room_; }
    const std::set<ConnectionId>& peers() const { return peers_; }
    const nlohmann::json& room_status() const { return room_status_; }
    const std::optional<std::string>& last_error() const { return last_error_; }

    // Finished senders are reported through on_send_finished and then dropped.
    SenderPipeline* sender(const std::string& file_id);
    std::size_t sender_count() const { return senders_.size(); }
    void on_send_finished(SendFinishedFn fn) { send_finished_fn_ = std::move(fn); }
    ReceiverPipeline& receiver() { return receiver_; }
    ResilienceMonitor& monitor() { return monitor_; }
    bool has_active_transfers() const;

private:
    void resume_transfers();
    void reap_senders();

    EventChannel& channel_;
    Scheduler& scheduler_;
    TransferConfig config_;

    ConnectionId id_;
    std::optional<std::string> room_;
    std::set<ConnectionId> peers_;
    nlohmann::json room_status_;
    std::optional<std::string> last_error_;

    std::map<std::string, std::unique_ptr<SenderPipeline>> senders_;
    ReceiverPipeline receiver_;
    ResilienceMonitor monitor_;
    Scheduler::TimerId resume_timer_ = Scheduler::NO_TIMER;
    Scheduler::TimerId reap_timer_ = Scheduler::NO_TIMER;
    SendFinishedFn send_finished_fn_;
};

} // namespace dropshare::client
