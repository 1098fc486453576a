#include "dropshare/room_registry.hpp"
#include "dropshare/utils.hpp"

#include <algorithm>

namespace dropshare {

RoomRegistry::RoomRegistry(std::size_t max_room_size) : max_room_size_(max_room_size) {}

JoinResult RoomRegistry::join(const ConnectionId& id, std::string_view raw_code) {
    std::string code = sanitize_room_code(raw_code);
    if (!is_valid_room_code(code)) return {JoinStatus::InvalidCode, code, {}};

    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(code);
    if (it != rooms_.end()) {
        auto& members = it->second;
        bool already = std::find(members.begin(), members.end(), id) != members.end();
        if (!already && members.size() >= max_room_size_) return {JoinStatus::RoomFull, code, {}};
        if (!already) members.push_back(id);
        return {JoinStatus::Joined, code, members};
    }
    auto& members = rooms_[code];
    members.push_back(id);
    return {JoinStatus::Joined, code, members};
}

std::optional<Departure> RoomRegistry::remove_locked(const ConnectionId& id, const std::string& code) {
    auto it = rooms_.find(code);
    if (it == rooms_.end()) return std::nullopt;
    auto& members = it->second;
    auto pos = std::find(members.begin(), members.end(), id);
    if (pos == members.end()) return std::nullopt;
    members.erase(pos);

    Departure d{code, members, false};
    if (members.empty()) {
        rooms_.erase(it);
        d.room_deleted = true;
    }
    return d;
}

std::optional<Departure> RoomRegistry::leave(const ConnectionId& id, std::string_view raw_code) {
    std::string code = sanitize_room_code(raw_code);
    std::lock_guard<std::mutex> lk(mu_);
    return remove_locked(id, code);
}

std::vector<Departure> RoomRegistry::remove_everywhere(const ConnectionId& id) {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> codes;
    for (auto& [code, members] : rooms_) {
        if (std::find(members.begin(), members.end(), id) != members.end()) codes.push_back(code);
    }
    std::vector<Departure> out;
    for (auto& code : codes) {
        if (auto d = remove_locked(id, code)) out.push_back(std::move(*d));
    }
    return out;
}

std::size_t RoomRegistry::sweep_empty() {
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t removed = 0;
    for (auto it = rooms_.begin(); it != rooms_.end();) {
        if (it->second.empty()) {
            it = rooms_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<ConnectionId> RoomRegistry::members(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(code);
    if (it == rooms_.end()) return {};
    return it->second;
}

std::size_t RoomRegistry::member_count(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(code);
    return it == rooms_.end() ? 0 : it->second.size();
}

bool RoomRegistry::has_room(const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.count(code) > 0;
}

bool RoomRegistry::is_member(const ConnectionId& id, const std::string& code) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = rooms_.find(code);
    if (it == rooms_.end()) return false;
    return std::find(it->second.begin(), it->second.end(), id) != it->second.end();
}

std::size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rooms_.size();
}

} // namespace dropshare
