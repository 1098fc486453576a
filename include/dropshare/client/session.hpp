#pragma once
#include "dropshare/types.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace dropshare::client {

struct TransferSession {
    std::string file_id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string mime_type;
    ConnectionId sender_id;
};

struct Progress {
    std::uint64_t bytes = 0;
    std::uint64_t total = 0;
    double percent = 0.0;
    std::int64_t elapsed_ms = 0;
    double bytes_per_second = 0.0;
};

inline Progress make_progress(std::uint64_t bytes, std::uint64_t total,
                              std::int64_t started_ms, std::int64_t now_ms) {
    Progress p;
    p.bytes = bytes;
    p.total = total;
    p.percent = total == 0 ? 100.0 : std::min(100.0, static_cast<double>(bytes) / static_cast<double>(total) * 100.0);
    p.elapsed_ms = std::max<std::int64_t>(0, now_ms - started_ms);
    if (p.elapsed_ms > 0) p.bytes_per_second = static_cast<double>(bytes) * 1000.0 / static_cast<double>(p.elapsed_ms);
    return p;
}

} // namespace dropshare::client
