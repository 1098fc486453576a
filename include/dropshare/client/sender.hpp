#pragma once
#include "channel.hpp"
#include "chunk_source.hpp"
#include "session.hpp"
#include "transfer_config.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace dropshare::client {

enum class SendState { Idle, Announcing, Streaming, Paused, Completing, Done, Failed };

const char* to_string(SendState state);

// Streams one file to a room: file-info, then file-chunk slices, then file-complete.
//
// Emission is paced by a fixed delay and bounded by an ack window: the sender never runs more
// than max_outstanding chunks ahead of the slowest receiver that acknowledges. After
// file-complete it lingers to serve file-resend requests until every receiver acked the full
// count or linger_timeout passes.
class SenderPipeline {
public:
    using Listener = std::function<void(const SenderPipeline&)>;

    SenderPipeline(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config,
                   std::string room, TransferSession session, std::unique_ptr<ChunkSource> source,
                   const std::vector<ConnectionId>& receivers);
    ~SenderPipeline();

    SenderPipeline(const SenderPipeline&) = delete;
    SenderPipeline& operator=(const SenderPipeline&) = delete;

    void start();

    // Transport went away: stop emitting and keep the byte offset.
    void pause();
    // Transport is back and the room re-joined: re-announce and continue from the offset.
    void resume();

    void on_ack(const ConnectionId& from, std::uint32_t received);
    void on_resend(const ConnectionId& from, const std::vector<std::uint32_t>& indices);
    void remove_receiver(const ConnectionId& id);

    SendState state() const { return state_; }
    const TransferSession& session() const { return session_; }
    const std::string& room() const { return room_; }
    std::uint32_t chunk_count() const { return chunk_count_; }
    std::uint32_t next_index() const { return next_index_; }
    std::uint64_t offset() const { return offset_; }
    std::size_t pending_resends() const { return resend_queue_.size(); }
    const std::string& failure() const { return failure_; }
    Progress progress() const;
    bool finished() const { return state_ == SendState::Done || state_ == SendState::Failed; }

    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    void set_state(SendState state);
    void pump();
    void schedule_pump(std::chrono::milliseconds delay);
    bool window_full() const;
    std::uint32_t slowest_ack() const;
    std::chrono::milliseconds pace() const;

    void emit_info(bool resume);
    void emit_chunk(std::uint32_t index);
    void emit_complete();
    void enter_completing();
    void linger();
    void maybe_finish();
    void finish();
    void fail(const std::string& reason);

    void arm_stall_timer();
    void cancel_timer(Scheduler::TimerId& id);
    void cancel_timers();

    EventChannel& channel_;
    Scheduler& scheduler_;
    TransferConfig config_;
    std::string room_;
    TransferSession session_;
    std::unique_ptr<ChunkSource> source_;

    SendState state_ = SendState::Idle;
    SendState paused_from_ = SendState::Idle;
    std::uint32_t chunk_count_ = 0;
    std::uint32_t next_index_ = 0;
    std::uint64_t offset_ = 0;
    std::int64_t started_ms_ = 0;
    std::string failure_;

    std::map<ConnectionId, std::uint32_t> acked_;
    std::deque<std::uint32_t> resend_queue_;

    Scheduler::TimerId pump_timer_ = Scheduler::NO_TIMER;
    Scheduler::TimerId stall_timer_ = Scheduler::NO_TIMER;
    Scheduler::TimerId linger_timer_ = Scheduler::NO_TIMER;

    Listener listener_;
};

} // namespace dropshare::client
