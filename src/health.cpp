#include "dropshare/health.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <unistd.h>

#include <cmath>
#include <fstream>
#include <memory>
#include <string>

namespace dropshare {

std::size_t resident_memory_bytes() {
    std::ifstream statm("/proc/self/statm");
    std::size_t total_pages = 0, resident_pages = 0;
    if (!(statm >> total_pages >> resident_pages)) return 0;
    long page = sysconf(_SC_PAGESIZE);
    return resident_pages * static_cast<std::size_t>(page > 0 ? page : 4096);
}

nlohmann::json health_report(std::chrono::steady_clock::duration uptime, std::size_t memory_bytes) {
    double seconds = std::chrono::duration<double>(uptime).count();
    long long mb = std::llround(static_cast<double>(memory_bytes) / 1024.0 / 1024.0);
    return nlohmann::json{{"status", "healthy"},
                          {"uptime", seconds},
                          {"memory", std::to_string(mb) + "MB"}};
}

std::optional<std::string> lan_ipv4_address() {
    ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) return std::nullopt;
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> list(raw, &freeifaddrs);

    std::optional<std::string> fallback;
    for (ifaddrs* ifa = list.get(); ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        char text[INET_ADDRSTRLEN];
        auto* in = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (!inet_ntop(AF_INET, &in->sin_addr, text, sizeof(text))) continue;

        std::string name = ifa->ifa_name ? ifa->ifa_name : "";
        if (name == "wlan0" || name == "eth0" || name == "en0") return std::string(text);
        if (!fallback) fallback = std::string(text);
    }
    return fallback;
}

} // namespace dropshare
