#pragma once
#include "types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dropshare {

enum class JoinStatus { Joined, InvalidCode, RoomFull };

struct JoinResult {
    JoinStatus status;
    std::string code;                  // sanitized code
    std::vector<ConnectionId> members; // full member list after the join, in join order
};

struct Departure {
    std::string code;
    std::vector<ConnectionId> remaining;
    bool room_deleted = false;
};

// Room code -> members. Every mutation runs under one lock, so the capacity check and the
// insert in join() cannot interleave with another join.
class RoomRegistry {
public:
    explicit RoomRegistry(std::size_t max_room_size = MAX_ROOM_SIZE);

    JoinResult join(const ConnectionId& id, std::string_view raw_code);

    // std::nullopt when the connection was not a member of that room.
    std::optional<Departure> leave(const ConnectionId& id, std::string_view raw_code);

    // Disconnect cleanup: removes the connection from every room it belongs to.
    std::vector<Departure> remove_everywhere(const ConnectionId& id);

    // Removes rooms whose member set is empty. Returns how many were removed.
    std::size_t sweep_empty();

    std::vector<ConnectionId> members(const std::string& code) const;
    std::size_t member_count(const std::string& code) const;
    bool has_room(const std::string& code) const;
    bool is_member(const ConnectionId& id, const std::string& code) const;
    std::size_t room_count() const;

private:
    std::optional<Departure> remove_locked(const ConnectionId& id, const std::string& code);

    std::size_t max_room_size_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, std::vector<ConnectionId>> rooms_;
};

} // namespace dropshare
