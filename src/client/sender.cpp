#include "dropshare/client/sender.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace dropshare::client {

const char* to_string(SendState state) {
    switch (state) {
    case SendState::Idle: return "idle";
    case SendState::Announcing: return "announcing";
    case SendState::Streaming: return "streaming";
    case SendState::Paused: return "paused";
    case SendState::Completing: return "completing";
    case SendState::Done: return "done";
    case SendState::Failed: return "failed";
    }
    return "unknown";
}

SenderPipeline::SenderPipeline(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config,
                               std::string room, TransferSession session,
                               std::unique_ptr<ChunkSource> source,
                               const std::vector<ConnectionId>& receivers)
    : channel_(channel),
      scheduler_(scheduler),
      config_(config),
      room_(std::move(room)),
      session_(std::move(session)),
      source_(std::move(source)) {
    if (!source_) throw std::invalid_argument("sender needs a source");
    if (config_.chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
    session_.file_size = source_->size();
    // An empty file still goes out as one empty chunk flagged isLast.
    auto chunks = (session_.file_size + config_.chunk_size - 1) / config_.chunk_size;
    chunk_count_ = static_cast<std::uint32_t>(std::max<std::uint64_t>(1, chunks));
    for (auto& r : receivers) acked_[r] = 0;
}

SenderPipeline::~SenderPipeline() { cancel_timers(); }

void SenderPipeline::set_state(SendState state) {
    if (state_ == state) return;
    LOG_DEBUG("Transfer " << session_.file_id << ": " << to_string(state_) << " -> " << to_string(state));
    state_ = state;
    if (listener_) listener_(*this);
}

std::chrono::milliseconds SenderPipeline::pace() const {
    return session_.file_size > config_.large_file_threshold ? config_.large_file_delay
                                                             : config_.small_file_delay;
}

Progress SenderPipeline::progress() const {
    return make_progress(std::min(offset_, session_.file_size), session_.file_size, started_ms_,
                         scheduler_.now_ms());
}

void SenderPipeline::start() {
    if (state_ != SendState::Idle) return;
    started_ms_ = scheduler_.now_ms();
    set_state(SendState::Announcing);
    emit_info(false);
    LOG_INFO("Sending " << session_.file_name << " (" << session_.file_size << " bytes, "
             << chunk_count_ << " chunks) as " << session_.file_id << " to room " << room_);
    set_state(SendState::Streaming);
    pump();
}

void SenderPipeline::emit_info(bool resume) {
    nlohmann::json info{{"room", room_},
                        {"fileId", session_.file_id},
                        {"fileName", session_.file_name},
                        {"fileSize", session_.file_size},
                        {"mimeType", session_.mime_type},
                        {"chunkCount", chunk_count_}};
    if (resume) info["resume"] = true;
    channel_.emit(events::FILE_INFO, info);
}

void SenderPipeline::emit_chunk(std::uint32_t index) {
    std::uint64_t offset = static_cast<std::uint64_t>(index) * config_.chunk_size;
    auto bytes = source_->read(offset, config_.chunk_size);
    bool is_last = offset + config_.chunk_size >= session_.file_size;
    channel_.emit(events::FILE_CHUNK, nlohmann::json{{"room", room_},
                                                     {"fileId", session_.file_id},
                                                     {"chunkIndex", index},
                                                     {"data", base64_encode(bytes)},
                                                     {"isLast", is_last}});
}

void SenderPipeline::emit_complete() {
    channel_.emit(events::FILE_COMPLETE, nlohmann::json{{"room", room_}, {"fileId", session_.file_id}});
}

std::uint32_t SenderPipeline::slowest_ack() const {
    std::uint32_t slowest = chunk_count_;
    for (auto& kv : acked_) slowest = std::min(slowest, kv.second);
    return slowest;
}

bool SenderPipeline::window_full() const {
    if (acked_.empty()) return false;
    return next_index_ - std::min(next_index_, slowest_ack()) >= config_.max_outstanding;
}

void SenderPipeline::schedule_pump(std::chrono::milliseconds delay) {
    if (pump_timer_ != Scheduler::NO_TIMER) return;
    pump_timer_ = scheduler_.schedule(delay, [this] {
        pump_timer_ = Scheduler::NO_TIMER;
        pump();
    });
}

void SenderPipeline::pump() {
    if (state_ != SendState::Streaming && state_ != SendState::Completing) return;

    try {
        if (!resend_queue_.empty()) {
            auto index = resend_queue_.front();
            resend_queue_.pop_front();
            emit_chunk(index);
            if (!resend_queue_.empty() || state_ == SendState::Streaming) schedule_pump(pace());
            else maybe_finish();
            return;
        }
        if (state_ == SendState::Completing) return;

        if (next_index_ >= chunk_count_) {
            enter_completing();
            return;
        }
        if (window_full()) {
            arm_stall_timer();
            return;
        }
        cancel_timer(stall_timer_);

        emit_chunk(next_index_);
        offset_ += config_.chunk_size;
        ++next_index_;
    } catch (const std::exception& e) {
        fail(std::string("read failed: ") + e.what());
        return;
    }

    if (next_index_ >= chunk_count_ && resend_queue_.empty()) enter_completing();
    else schedule_pump(pace());
}

void SenderPipeline::arm_stall_timer() {
    if (stall_timer_ != Scheduler::NO_TIMER) return;
    stall_timer_ = scheduler_.schedule(config_.stall_timeout, [this] {
        stall_timer_ = Scheduler::NO_TIMER;
        if (state_ == SendState::Streaming && window_full())
            fail("no acknowledgment from receivers");
    });
}

void SenderPipeline::enter_completing() {
    cancel_timer(stall_timer_);
    set_state(SendState::Completing);
    emit_complete();
    maybe_finish();
    if (state_ == SendState::Completing) linger();
}

void SenderPipeline::linger() {
    if (linger_timer_ != Scheduler::NO_TIMER) return;
    linger_timer_ = scheduler_.schedule(config_.linger_timeout, [this] {
        linger_timer_ = Scheduler::NO_TIMER;
        if (state_ != SendState::Completing) return;
        LOG_WARN("Transfer " << session_.file_id << ": not every receiver confirmed, closing anyway");
        finish();
    });
}

void SenderPipeline::maybe_finish() {
    if (state_ != SendState::Completing || !resend_queue_.empty()) return;
    if (slowest_ack() >= chunk_count_) finish();
}

void SenderPipeline::finish() {
    cancel_timers();
    resend_queue_.clear();
    source_.reset();
    auto p = progress();
    LOG_INFO("Transfer " << session_.file_id << " sent in " << p.elapsed_ms << " ms");
    set_state(SendState::Done);
}

void SenderPipeline::fail(const std::string& reason) {
    cancel_timers();
    resend_queue_.clear();
    failure_ = reason;
    LOG_WARN("Transfer " << session_.file_id << " failed: " << reason);
    set_state(SendState::Failed);
}

void SenderPipeline::on_ack(const ConnectionId& from, std::uint32_t received) {
    if (finished()) return;
    received = std::min(received, chunk_count_);
    auto& acked = acked_[from];
    acked = std::max(acked, received);

    if (state_ == SendState::Streaming) {
        if (!window_full()) cancel_timer(stall_timer_);
        schedule_pump(std::chrono::milliseconds(0));
    } else if (state_ == SendState::Completing) {
        maybe_finish();
        // A receiver that is still short after the sweep of resends may have missed file-complete.
        if (state_ == SendState::Completing && acked < chunk_count_ && resend_queue_.empty() &&
            pump_timer_ == Scheduler::NO_TIMER)
            emit_complete();
    }
}

void SenderPipeline::on_resend(const ConnectionId& from, const std::vector<std::uint32_t>& indices) {
    if (state_ == SendState::Idle || finished()) {
        LOG_DEBUG("Ignoring resend request from " << from << " for " << session_.file_id);
        return;
    }
    std::size_t queued = 0;
    for (auto index : indices) {
        if (index >= chunk_count_ || index >= next_index_) continue;
        if (std::find(resend_queue_.begin(), resend_queue_.end(), index) != resend_queue_.end()) continue;
        resend_queue_.push_back(index);
        ++queued;
    }
    LOG_INFO("Transfer " << session_.file_id << ": " << queued << " chunks queued for resend to " << from);
    if (queued > 0 && (state_ == SendState::Streaming || state_ == SendState::Completing))
        schedule_pump(std::chrono::milliseconds(0));
}

void SenderPipeline::remove_receiver(const ConnectionId& id) {
    if (acked_.erase(id) == 0 || finished()) return;
    if (state_ == SendState::Streaming && !window_full()) {
        cancel_timer(stall_timer_);
        schedule_pump(std::chrono::milliseconds(0));
    } else if (state_ == SendState::Completing) {
        maybe_finish();
    }
}

void SenderPipeline::pause() {
    if (state_ != SendState::Announcing && state_ != SendState::Streaming && state_ != SendState::Completing)
        return;
    paused_from_ = state_;
    cancel_timers();
    LOG_INFO("Transfer " << session_.file_id << " paused at offset " << offset_);
    set_state(SendState::Paused);
}

void SenderPipeline::resume() {
    if (state_ != SendState::Paused) return;
    // Receiver ids change across reconnects; acks after the re-announce rebuild the set.
    acked_.clear();
    emit_info(true);
    LOG_INFO("Transfer " << session_.file_id << " resuming at chunk " << next_index_);
    if (paused_from_ == SendState::Completing) {
        // Everything was emitted; only resends are left to serve.
        set_state(SendState::Completing);
        emit_complete();
        linger();
        if (!resend_queue_.empty()) schedule_pump(std::chrono::milliseconds(0));
        return;
    }
    set_state(SendState::Streaming);
    schedule_pump(pace());
}

void SenderPipeline::cancel_timer(Scheduler::TimerId& id) {
    if (id == Scheduler::NO_TIMER) return;
    scheduler_.cancel(id);
    id = Scheduler::NO_TIMER;
}

void SenderPipeline::cancel_timers() {
    cancel_timer(pump_timer_);
    cancel_timer(stall_timer_);
    cancel_timer(linger_timer_);
}

} // namespace dropshare::client
