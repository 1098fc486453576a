#include "dropshare/client/receiver.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace dropshare::client {

namespace {

std::uint64_t read_size(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) return 0;
    if (it->is_number_float()) {
        double v = it->get<double>();
        return v > 0 ? static_cast<std::uint64_t>(v) : 0;
    }
    if (it->is_number_integer() && it->get<long long>() < 0) return 0;
    return it->get<std::uint64_t>();
}

std::string string_field(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::optional<std::uint32_t> count_field(const nlohmann::json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    return json_index(*it);
}

// Every chunk but the last carries at least one byte.
bool plausible_count(std::uint32_t count, std::uint64_t file_size) {
    return count <= std::max<std::uint64_t>(1, file_size);
}

std::string sanitize_file_name(const std::string& name, const std::string& fallback) {
    std::string base = std::filesystem::path(name).filename().string();
    std::string out;
    for (char c : base) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || c == '/' || c == '\\' || c == ':') out.push_back('_');
        else out.push_back(c);
    }
    if (out.empty() || out == "." || out == "..") return fallback;
    return out;
}

} // namespace

bool ChunkBuffer::store(std::uint32_t index, std::vector<std::uint8_t> bytes) {
    auto [it, inserted] = chunks_.try_emplace(index, std::move(bytes));
    if (!inserted) return false;
    received_bytes_ += it->second.size();
    while (chunks_.count(contiguous_)) ++contiguous_;
    return true;
}

bool ChunkBuffer::has(std::uint32_t index) const {
    return chunks_.count(index) != 0;
}

std::vector<std::uint32_t> ChunkBuffer::missing(std::uint32_t expected, std::uint32_t limit) const {
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = contiguous_; i < expected && out.size() < limit; ++i)
        if (!has(i)) out.push_back(i);
    return out;
}

std::vector<std::uint8_t> ChunkBuffer::assemble() const {
    std::vector<std::uint8_t> out;
    out.reserve(received_bytes_);
    for (auto& [index, chunk] : chunks_) out.insert(out.end(), chunk.begin(), chunk.end());
    return out;
}

ReceiverPipeline::ReceiverPipeline(EventChannel& channel, Scheduler& scheduler, const TransferConfig& config)
    : channel_(channel), scheduler_(scheduler), config_(config) {}

ReceiverPipeline::~ReceiverPipeline() {
    for (auto& kv : active_)
        if (kv.second.resend_timer != Scheduler::NO_TIMER) scheduler_.cancel(kv.second.resend_timer);
    for (auto& kv : expiry_timers_) scheduler_.cancel(kv.second);
}

std::uint32_t ReceiverPipeline::expected_count(const IncomingTransfer& t) const {
    return t.expected_chunks.value_or(t.buffer.slots());
}

std::vector<std::uint32_t> ReceiverPipeline::gaps(const IncomingTransfer& t, std::uint32_t expected) const {
    return t.buffer.missing(expected, config_.max_resend_batch);
}

void ReceiverPipeline::expire_later(const std::string& file_id) {
    if (auto it = expiry_timers_.find(file_id); it != expiry_timers_.end()) scheduler_.cancel(it->second);
    expiry_timers_[file_id] = scheduler_.schedule(config_.linger_timeout, [this, file_id] {
        expiry_timers_.erase(file_id);
        delivered_.erase(file_id);
        failed_.erase(file_id);
    });
}

void ReceiverPipeline::on_file_info(const nlohmann::json& data) {
    if (!validate_schema(data, {{"fileId", "string"}})) {
        LOG_WARN("Ignoring file-info without fileId");
        return;
    }
    std::string id = data["fileId"].get<std::string>();
    std::string sender = string_field(data, "sender");

    if (delivered_.count(id)) {
        // Re-announce for something we already have: confirm so the sender can stop.
        ack_delivered(id, sender);
        return;
    }

    if (auto it = active_.find(id); it != active_.end()) {
        auto& t = it->second;
        if (!sender.empty()) t.session.sender_id = sender;
        if (auto count = count_field(data, "chunkCount")) {
            if (plausible_count(*count, t.session.file_size)) t.expected_chunks = count;
            else LOG_WARN("Ignoring chunk count " << *count << " for " << id);
        }
        LOG_INFO("Sender of " << id << " is back, " << t.buffer.contiguous() << " chunks in order so far");
        send_ack(t);
        auto holes = gaps(t, t.buffer.slots());
        if (!holes.empty()) request(t, std::move(holes));
        return;
    }

    auto size = read_size(data, "fileSize");
    if (size > config_.max_file_size) {
        LOG_WARN("Ignoring " << id << ": " << size << " bytes exceeds the " << config_.max_file_size << " byte limit");
        return;
    }
    auto count = count_field(data, "chunkCount");
    if (count && !plausible_count(*count, size)) {
        LOG_WARN("Ignoring " << id << ": " << *count << " chunks for " << size << " bytes");
        return;
    }

    IncomingTransfer t;
    t.session.file_id = id;
    t.session.file_name = string_field(data, "fileName");
    t.session.file_size = size;
    t.session.mime_type = string_field(data, "mimeType");
    t.session.sender_id = sender;
    t.expected_chunks = count;
    t.started_ms = scheduler_.now_ms();
    LOG_INFO("Receiving " << t.session.file_name << " (" << t.session.file_size << " bytes) from " << sender);
    active_.emplace(id, std::move(t));
}

void ReceiverPipeline::on_chunk(const nlohmann::json& data) {
    if (!validate_schema(data, {{"fileId", "string"}, {"chunkIndex", "integer"}, {"data", "string"}})) {
        LOG_WARN("Ignoring malformed file-chunk");
        return;
    }
    std::string id = data["fileId"].get<std::string>();
    auto it = active_.find(id);
    if (it == active_.end()) {
        LOG_DEBUG("Chunk for unknown transfer " << id);
        return;
    }
    auto& t = it->second;

    auto raw_index = json_index(data["chunkIndex"]);
    std::uint64_t limit = t.expected_chunks ? *t.expected_chunks : t.session.file_size + 1;
    if (!raw_index || *raw_index >= limit) {
        LOG_WARN("Chunk index " << data["chunkIndex"].dump() << " out of range for " << id);
        return;
    }
    auto index = *raw_index;

    auto bytes = base64_decode(data["data"].get_ref<const std::string&>());
    if (!bytes) {
        LOG_WARN("Undecodable chunk " << index << " for " << id);
        return;
    }

    if (auto sender = string_field(data, "sender"); !sender.empty()) t.session.sender_id = sender;
    bool is_last = data.contains("isLast") && data["isLast"].is_boolean() && data["isLast"].get<bool>();
    if (!t.buffer.store(index, std::move(*bytes))) LOG_DEBUG("Duplicate chunk " << index << " for " << id);
    if (is_last && !t.expected_chunks) t.expected_chunks = index + 1;

    if (++t.chunks_since_ack >= config_.ack_every || is_last) send_ack(t);

    if (t.complete_seen) {
        try_finalize(t);
        return;
    }
    if (t.status == ReceiveStatus::AwaitingResend && t.buffer.complete(t.buffer.slots())) {
        if (t.resend_timer != Scheduler::NO_TIMER) scheduler_.cancel(t.resend_timer);
        t.resend_timer = Scheduler::NO_TIMER;
        t.status = ReceiveStatus::Receiving;
        send_ack(t);
    }
}

void ReceiverPipeline::on_complete(const nlohmann::json& data) {
    if (!validate_schema(data, {{"fileId", "string"}})) return;
    std::string id = data["fileId"].get<std::string>();
    std::string sender = string_field(data, "sender");
    auto it = active_.find(id);
    if (it == active_.end()) {
        if (delivered_.count(id)) ack_delivered(id, sender);
        return;
    }
    auto& t = it->second;
    if (!sender.empty()) t.session.sender_id = sender;
    t.complete_seen = true;
    if (try_finalize(t)) return;
    if (t.status == ReceiveStatus::AwaitingResend) return;
    request(t, gaps(t, expected_count(t)));
}

void ReceiverPipeline::on_reconnect() {
    std::vector<std::string> ids;
    for (auto& kv : active_) ids.push_back(kv.first);
    for (auto& id : ids) {
        auto it = active_.find(id);
        if (it == active_.end()) continue;
        auto& t = it->second;
        auto holes = gaps(t, t.complete_seen ? expected_count(t) : t.buffer.slots());
        if (holes.empty()) {
            send_ack(t);
            if (t.complete_seen) try_finalize(t);
            continue;
        }
        request(t, std::move(holes));
    }
}

void ReceiverPipeline::ack_delivered(const std::string& file_id, const ConnectionId& sender) {
    if (sender.empty()) return;
    channel_.emit(events::FILE_ACK, nlohmann::json{{"target", sender},
                                                   {"fileId", file_id},
                                                   {"received", delivered_[file_id]}});
}

void ReceiverPipeline::send_ack(IncomingTransfer& t) {
    t.chunks_since_ack = 0;
    if (t.session.sender_id.empty()) return;
    channel_.emit(events::FILE_ACK, nlohmann::json{{"target", t.session.sender_id},
                                                   {"fileId", t.session.file_id},
                                                   {"received", t.buffer.contiguous()}});
}

void ReceiverPipeline::request(IncomingTransfer& t, std::vector<std::uint32_t> indices) {
    if (t.resend_requests >= config_.max_resend_requests) {
        fail(t.session.file_id, std::move(indices),
             "chunks still missing after " + std::to_string(t.resend_requests) + " resend requests");
        return;
    }
    ++t.resend_requests;
    t.status = ReceiveStatus::AwaitingResend;
    send_ack(t);
    LOG_INFO("Requesting " << indices.size() << " missing chunks of " << t.session.file_id
             << " (attempt " << t.resend_requests << ")");
    channel_.emit(events::FILE_RESEND, nlohmann::json{{"target", t.session.sender_id},
                                                      {"fileId", t.session.file_id},
                                                      {"chunks", indices}});

    if (t.resend_timer != Scheduler::NO_TIMER) scheduler_.cancel(t.resend_timer);
    std::string id = t.session.file_id;
    t.resend_timer = scheduler_.schedule(config_.resend_timeout, [this, id] {
        auto it = active_.find(id);
        if (it == active_.end()) return;
        auto& t = it->second;
        t.resend_timer = Scheduler::NO_TIMER;
        if (t.complete_seen) {
            if (try_finalize(t)) return;
            request(t, gaps(t, expected_count(t)));
            return;
        }
        auto holes = gaps(t, t.buffer.slots());
        if (holes.empty()) t.status = ReceiveStatus::Receiving;
        else request(t, std::move(holes));
    });
}

bool ReceiverPipeline::try_finalize(IncomingTransfer& t) {
    auto expected = expected_count(t);
    if (!t.buffer.complete(expected)) return false;

    std::string id = t.session.file_id;
    auto data = t.buffer.assemble();
    if (data.size() != t.session.file_size) {
        fail(id, {}, "assembled " + std::to_string(data.size()) + " bytes, expected " +
                         std::to_string(t.session.file_size));
        return true;
    }

    send_ack(t);
    if (t.resend_timer != Scheduler::NO_TIMER) scheduler_.cancel(t.resend_timer);
    auto p = make_progress(data.size(), t.session.file_size, t.started_ms, scheduler_.now_ms());
    LOG_INFO("File transfer complete: " << t.session.file_name << " (" << data.size() << " bytes in "
             << p.elapsed_ms << " ms)");

    ReceivedFile file{t.session, std::move(data)};
    delivered_[id] = expected;
    expire_later(id);
    active_.erase(id);
    auto& stored = completed_[id] = std::move(file);
    if (completed_fn_) completed_fn_(stored);
    return true;
}

void ReceiverPipeline::fail(const std::string& file_id, std::vector<std::uint32_t> missing, const std::string& reason) {
    auto it = active_.find(file_id);
    if (it == active_.end()) return;
    if (it->second.resend_timer != Scheduler::NO_TIMER) scheduler_.cancel(it->second.resend_timer);
    FailedTransfer failure{it->second.session, std::move(missing), reason};
    active_.erase(it);
    LOG_WARN("Transfer " << file_id << " failed: " << reason);
    auto& stored = failed_[file_id] = std::move(failure);
    expire_later(file_id);
    if (failed_fn_) failed_fn_(stored);
}

std::optional<ReceivedFile> ReceiverPipeline::take(const std::string& file_id) {
    auto it = completed_.find(file_id);
    if (it == completed_.end()) return std::nullopt;
    ReceivedFile out = std::move(it->second);
    completed_.erase(it);
    return out;
}

const IncomingTransfer* ReceiverPipeline::find(const std::string& file_id) const {
    auto it = active_.find(file_id);
    return it == active_.end() ? nullptr : &it->second;
}

std::optional<Progress> ReceiverPipeline::progress(const std::string& file_id) const {
    auto it = active_.find(file_id);
    if (it == active_.end()) return std::nullopt;
    return make_progress(it->second.buffer.received_bytes(), it->second.session.file_size,
                         it->second.started_ms, scheduler_.now_ms());
}

std::vector<std::string> ReceiverPipeline::completed_ids() const {
    std::vector<std::string> out;
    for (auto& kv : completed_) out.push_back(kv.first);
    return out;
}

std::string ReceiverPipeline::save(const ReceivedFile& file, const std::string& directory) {
    auto path = std::filesystem::path(directory) / sanitize_file_name(file.session.file_name, file.session.file_id);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot create " + path.string());
    out.write(reinterpret_cast<const char*>(file.data.data()), static_cast<std::streamsize>(file.data.size()));
    if (!out) throw std::runtime_error("write failed for " + path.string());
    return path.string();
}

} // namespace dropshare::client
