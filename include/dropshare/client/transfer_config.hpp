#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dropshare::client {

struct TransferConfig {
    std::size_t chunk_size = 64 * 1024;
    std::uint64_t large_file_threshold = 5ull * 1024 * 1024;
    std::chrono::milliseconds small_file_delay{5};
    std::chrono::milliseconds large_file_delay{10};

    // Outgoing files above this size are refused; announcements above it are ignored.
    std::uint64_t max_file_size = 100ull * 1024 * 1024;
    // Matched case-insensitively against the end of the file name.
    std::vector<std::string> blocked_extensions{".exe", ".bat", ".cmd", ".scr"};

    // Chunks the sender may run ahead of the slowest acknowledging receiver.
    std::uint32_t max_outstanding = 16;
    std::uint32_t ack_every = 4;
    std::chrono::milliseconds stall_timeout{30000};
    std::chrono::milliseconds linger_timeout{60000};

    std::uint32_t max_resend_requests = 3;
    std::chrono::milliseconds resend_timeout{5000};
    std::uint32_t max_resend_batch = 1024;

    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds background_heartbeat_interval{5000};
    std::chrono::milliseconds unhealthy_after{30000};
    std::chrono::milliseconds reconnect_probe_interval{30000};
    std::chrono::milliseconds resume_delay{2000};
};

} // namespace dropshare::client
