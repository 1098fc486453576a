#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dropshare {

using ConnectionId = std::string;

constexpr char ENDPOINT[] = "/ws";
constexpr char HEALTH_ENDPOINT[] = "/health";
constexpr int DEFAULT_PORT = 3000;

constexpr std::size_t ROOM_CODE_LENGTH = 6;
constexpr std::size_t MAX_ROOM_SIZE = 10;
constexpr std::size_t MAX_JOINS_PER_WINDOW = 30;
constexpr auto RATE_LIMIT_WINDOW = std::chrono::seconds(60);
constexpr auto ROOM_CLEANUP_INTERVAL = std::chrono::minutes(5);

// Matches the 100 MB buffer the relay has always allowed per message.
constexpr std::size_t MAX_CLIENT_MSG = 100'000'000;
constexpr unsigned IDLE_TIMEOUT_SECONDS = 120;

// Wire event names.
namespace events {
constexpr char CONNECTED[] = "connected";
constexpr char JOIN_ROOM[] = "join-room";
constexpr char LEAVE_ROOM[] = "leave-room";
constexpr char USERS_IN_ROOM[] = "users-in-room";
constexpr char USER_JOINED[] = "user-joined";
constexpr char USER_LEFT[] = "user-left";
constexpr char ROOM_STATUS[] = "room-status";
constexpr char OFFER[] = "offer";
constexpr char ANSWER[] = "answer";
constexpr char ICE_CANDIDATE[] = "ice-candidate";
constexpr char FILE_INFO[] = "file-info";
constexpr char FILE_CHUNK[] = "file-chunk";
constexpr char FILE_COMPLETE[] = "file-complete";
constexpr char FILE_ACK[] = "file-ack";
constexpr char FILE_RESEND[] = "file-resend";
constexpr char PING[] = "ping";
constexpr char PONG[] = "pong";
constexpr char ERROR[] = "error";
} // namespace events

// Error codes carried in the "code" field of an error event.
namespace errors {
constexpr char VALIDATION[] = "validation";
constexpr char RATE_LIMITED[] = "rate_limited";
constexpr char ROOM_FULL[] = "room_full";
constexpr char TOO_LARGE[] = "too_large";
} // namespace errors

} // namespace dropshare
