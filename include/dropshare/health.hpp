#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace dropshare {

// Resident set size of this process in bytes, 0 if it cannot be read.
std::size_t resident_memory_bytes();

// {"status":"healthy","uptime":<seconds>,"memory":"<N>MB"}
nlohmann::json health_report(std::chrono::steady_clock::duration uptime, std::size_t memory_bytes);

// First IPv4 address of an interface that is up and not loopback, preferring wlan0, eth0
// and en0. std::nullopt when there is none.
std::optional<std::string> lan_ipv4_address();

} // namespace dropshare
