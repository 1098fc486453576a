#pragma once
#include "channel.hpp"
#include "session.hpp"
#include "transfer_config.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dropshare::client {

// Sparse, index-addressed chunk store. Later indices may arrive before earlier ones.
class ChunkBuffer {
public:
    // Returns false if the slot was already filled; the first copy is kept.
    bool store(std::uint32_t index, std::vector<std::uint8_t> bytes);
    bool has(std::uint32_t index) const;

    // Highest stored index + 1.
    std::uint32_t slots() const { return chunks_.empty() ? 0 : chunks_.rbegin()->first + 1; }
    std::uint64_t received_bytes() const { return received_bytes_; }
    // Number of filled slots starting at index 0 without a gap.
    std::uint32_t contiguous() const { return contiguous_; }
    bool complete(std::uint32_t expected) const { return contiguous_ >= expected; }
    // At most limit indices below expected that have not arrived, lowest first.
    std::vector<std::uint32_t> missing(std::uint32_t expected, std::uint32_t limit) const;
    std::vector<std::uint8_t> assemble() const;

private:
    std::map<std::uint32_t, std::vector<std::uint8_t>> chunks_;
    std::uint64_t received_bytes_ = 0;
    std::uint32_t contiguous_ = 0;
};

enum class ReceiveStatus { Receiving, AwaitingResend };

struct IncomingTransfer {
    TransferSession session;
    ChunkBuffer buffer;
    std::optional<std::uint32_t> expected_chunks;
    ReceiveStatus status = ReceiveStatus::Receiving;
    bool complete_seen = false;
    std::uint32_t resend_requests = 0;
    std::uint32_t chunks_since_ack = 0;
    std::int64_t started_ms = 0;
    Scheduler::TimerId resend_timer = Scheduler::NO_TIMER;
};

struct ReceivedFile {
    TransferSession session;
    std::vector<std::uint8_t> data;
};

struct FailedTransfer {
    TransferSession session;
    std::vector<std::uint32_t> missing;
    std::string reason;
};

class ReceiverPipeline {
public:
    using CompletedFn = std::function<void(const ReceivedFile&)>;
    using FailedFn = std::function<void(const FailedTransfer&)>;

    ReceiverPipeline(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config);
    ~ReceiverPipeline();

    ReceiverPipeline(const ReceiverPipeline&) = delete;
    ReceiverPipeline& operator=(const ReceiverPipeline&) = delete;

    void on_file_info(const nlohmann::json& data);
    void on_chunk(const nlohmann::json& data);
    void on_complete(const nlohmann::json& data);

    // After our own reconnect: ask senders for whatever went missing while we were away.
    void on_reconnect();

    // Hands over a finished artifact and forgets it.
    std::optional<ReceivedFile> take(const std::string& file_id);

    const IncomingTransfer* find(const std::string& file_id) const;
    std::optional<Progress> progress(const std::string& file_id) const;
    std::vector<std::string> completed_ids() const;
    // Failures and delivered ids are forgotten linger_timeout after they settle.
    const std::map<std::string, FailedTransfer>& failures() const { return failed_; }
    std::size_t delivered_count() const { return delivered_.size(); }
    bool has_active() const { return !active_.empty(); }

    void on_completed(CompletedFn fn) { completed_fn_ = std::move(fn); }
    void on_failed(FailedFn fn) { failed_fn_ = std::move(fn); }

    // Writes the artifact under directory using a sanitized file name. Returns the path.
    // Throws std::runtime_error on I/O failure.
    static std::string save(const ReceivedFile& file, const std::string& directory);

private:
    void send_ack(IncomingTransfer& t);
    void ack_delivered(const std::string& file_id, const ConnectionId& sender);
    void request(IncomingTransfer& t, std::vector<std::uint32_t> indices);
    bool try_finalize(IncomingTransfer& t);
    void fail(const std::string& file_id, std::vector<std::uint32_t> missing, const std::string& reason);
    std::uint32_t expected_count(const IncomingTransfer& t) const;
    std::vector<std::uint32_t> gaps(const IncomingTransfer& t, std::uint32_t expected) const;
    void expire_later(const std::string& file_id);

    EventChannel& channel_;
    Scheduler& scheduler_;
    TransferConfig config_;

    std::map<std::string, IncomingTransfer> active_;
    std::map<std::string, ReceivedFile> completed_;
    std::map<std::string, FailedTransfer> failed_;
    // Chunk count of every artifact delivered, kept after take() so late re-announces get acked.
    std::map<std::string, std::uint32_t> delivered_;
    std::map<std::string, Scheduler::TimerId> expiry_timers_;

    CompletedFn completed_fn_;
    FailedFn failed_fn_;
};

} // namespace dropshare::client
