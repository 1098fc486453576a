#include "dropshare/client/transfer_client.hpp"
#include "dropshare/logger.hpp"
#include "dropshare/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace dropshare::client {

namespace {

bool ends_with_ci(const std::string& name, const std::string& suffix) {
    if (suffix.size() > name.size()) return false;
    return std::equal(suffix.rbegin(), suffix.rend(), name.rbegin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

TransferClient::TransferClient(EventChannel& channel, Scheduler& scheduler, TransferConfig config)
    : channel_(channel),
      scheduler_(scheduler),
      config_(config),
      receiver_(channel, scheduler, config_),
      monitor_(channel, scheduler, config_) {
    monitor_.set_activity_probe([this] { return has_active_transfers(); });
    monitor_.start();
}

TransferClient::~TransferClient() {
    if (resume_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(resume_timer_);
    if (reap_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(reap_timer_);
    monitor_.stop();
}

void TransferClient::handle_frame(std::string_view raw) {
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded() || !validate_schema(j, {{"event", "string"}})) {
        LOG_WARN("Invalid frame from relay");
        return;
    }
    try {
        handle_event(j["event"].get<std::string>(), j.contains("data") ? j["data"] : nlohmann::json());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle " << j["event"].get<std::string>() << ": " << e.what());
    }
}

void TransferClient::handle_event(const std::string& event, const nlohmann::json& data) {
    if (event == events::CONNECTED) {
        if (data.is_object() && data.contains("id") && data["id"].is_string()) id_ = data["id"].get<std::string>();
        LOG_INFO("Connected to relay as " << id_);
    }
    else if (event == events::USERS_IN_ROOM) {
        peers_.clear();
        if (data.is_array())
            for (auto& u : data)
                if (u.is_string()) peers_.insert(u.get<std::string>());
    }
    else if (event == events::USER_JOINED) {
        if (data.is_string()) peers_.insert(data.get<std::string>());
    }
    else if (event == events::USER_LEFT) {
        if (!data.is_string()) return;
        auto who = data.get<std::string>();
        peers_.erase(who);
        for (auto& kv : senders_) kv.second->remove_receiver(who);
    }
    else if (event == events::ROOM_STATUS) {
        room_status_ = data;
        if (data.is_object() && data.contains("roomId") && data["roomId"].is_string())
            room_ = data["roomId"].get<std::string>();
    }
    else if (event == events::ERROR) {
        std::string message = data.is_object() && data.contains("message") && data["message"].is_string()
                                  ? data["message"].get<std::string>() : std::string("unknown error");
        LOG_WARN("Relay error: " << message);
        last_error_ = message;
        // A rejected join leaves us outside any room.
        if (room_ && room_status_.is_null()) {
            room_.reset();
            monitor_.set_wants_connection(false);
        }
    }
    else if (event == events::FILE_INFO) receiver_.on_file_info(data);
    else if (event == events::FILE_CHUNK) receiver_.on_chunk(data);
    else if (event == events::FILE_COMPLETE) receiver_.on_complete(data);
    else if (event == events::FILE_ACK) {
        if (!validate_schema(data, {{"fileId", "string"}, {"received", "integer"}, {"sender", "string"}})) return;
        auto* s = sender(data["fileId"].get<std::string>());
        auto received = json_index(data["received"]);
        if (s && received) s->on_ack(data["sender"].get<std::string>(), *received);
    }
    else if (event == events::FILE_RESEND) {
        if (!validate_schema(data, {{"fileId", "string"}, {"chunks", "array"}, {"sender", "string"}})) return;
        auto* s = sender(data["fileId"].get<std::string>());
        if (!s) return;
        std::vector<std::uint32_t> indices;
        for (auto& c : data["chunks"])
            if (auto index = json_index(c)) indices.push_back(*index);
        s->on_resend(data["sender"].get<std::string>(), indices);
    }
    else if (event == events::PONG) monitor_.on_pong(data);
    else LOG_DEBUG("Unhandled event " << event);
}

void TransferClient::join_room(const std::string& raw_code) {
    std::string code = sanitize_room_code(raw_code);
    if (room_ != code) room_status_ = nlohmann::json();
    room_ = code;
    last_error_.reset();
    monitor_.set_wants_connection(true);
    channel_.emit(events::JOIN_ROOM, code);
}

std::string TransferClient::create_room() {
    std::string code = random_room_code();
    join_room(code);
    return code;
}

void TransferClient::leave_room() {
    if (!room_) return;
    channel_.emit(events::LEAVE_ROOM, *room_);
    room_.reset();
    peers_.clear();
    room_status_ = nlohmann::json();
    monitor_.set_wants_connection(false);
}

std::string TransferClient::generate_file_id() const {
    return std::to_string(scheduler_.now_ms()) + "-" + random_hex(8);
}

std::string TransferClient::send_file(std::unique_ptr<ChunkSource> source, const std::string& file_name,
                                      const std::string& mime_type) {
    if (!source) throw std::invalid_argument("no file source");
    if (source->size() > config_.max_file_size)
        throw std::invalid_argument(file_name + ": file too large (max " + std::to_string(config_.max_file_size) +
                                    " bytes)");
    for (auto& ext : config_.blocked_extensions)
        if (ends_with_ci(file_name, ext)) throw std::invalid_argument(file_name + ": file type not allowed");
    if (!room_) throw std::logic_error("not in a room");
    if (peers_.empty()) throw std::logic_error("no connected devices");

    TransferSession session;
    session.file_id = generate_file_id();
    session.file_name = file_name;
    session.mime_type = mime_type;
    session.sender_id = id_;

    std::vector<ConnectionId> receivers(peers_.begin(), peers_.end());
    auto pipeline = std::make_unique<SenderPipeline>(channel_, scheduler_, config_, *room_, session,
                                                     std::move(source), receivers);
    auto* raw = pipeline.get();
    raw->set_listener([this](const SenderPipeline& p) {
        if (!p.finished()) return;
        if (send_finished_fn_) send_finished_fn_(p);
        if (reap_timer_ == Scheduler::NO_TIMER)
            reap_timer_ = scheduler_.schedule(std::chrono::milliseconds(0), [this] {
                reap_timer_ = Scheduler::NO_TIMER;
                reap_senders();
            });
    });
    senders_[session.file_id] = std::move(pipeline);
    raw->start();
    return session.file_id;
}

SenderPipeline* TransferClient::sender(const std::string& file_id) {
    auto it = senders_.find(file_id);
    return it == senders_.end() ? nullptr : it->second.get();
}

void TransferClient::reap_senders() {
    for (auto it = senders_.begin(); it != senders_.end();) {
        if (it->second->finished()) it = senders_.erase(it);
        else ++it;
    }
}

bool TransferClient::has_active_transfers() const {
    for (auto& kv : senders_)
        if (!kv.second->finished()) return true;
    return receiver_.has_active();
}

void TransferClient::on_disconnected() {
    for (auto& kv : senders_) kv.second->pause();
    if (resume_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(resume_timer_);
    resume_timer_ = Scheduler::NO_TIMER;
    monitor_.on_disconnected();
    if (has_active_transfers()) LOG_WARN("Connection lost - transfers will resume when reconnected");
}

void TransferClient::on_connected() {
    monitor_.on_connected();
    if (!room_) return;
    channel_.emit(events::JOIN_ROOM, *room_);
    if (resume_timer_ != Scheduler::NO_TIMER) scheduler_.cancel(resume_timer_);
    resume_timer_ = scheduler_.schedule(config_.resume_delay, [this] {
        resume_timer_ = Scheduler::NO_TIMER;
        resume_transfers();
    });
}

void TransferClient::resume_transfers() {
    if (!channel_.connected()) return;
    for (auto& kv : senders_) kv.second->resume();
    receiver_.on_reconnect();
}

} // namespace dropshare::client
