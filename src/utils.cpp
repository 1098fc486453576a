#include "dropshare/utils.hpp"
#include "dropshare/types.hpp"

#include <array>
#include <cctype>
#include <mutex>
#include <random>

namespace dropshare {

namespace {

constexpr char BASE64_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr char ROOM_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr char ID_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_-";
constexpr char HEX_ALPHABET[] = "0123456789abcdef";

std::mt19937_64& rng() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex& rng_mutex() {
    static std::mutex mu;
    return mu;
}

template <std::size_t N>
std::string random_from(const char (&alphabet)[N], std::size_t length) {
    std::uniform_int_distribution<std::size_t> pick(0, N - 2);
    std::string out;
    out.reserve(length);
    std::lock_guard<std::mutex> lk(rng_mutex());
    for (std::size_t i = 0; i < length; ++i) out.push_back(alphabet[pick(rng())]);
    return out;
}

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string sanitize_room_code(std::string_view raw) {
    std::string out;
    out.reserve(ROOM_CODE_LENGTH);
    for (char c : raw) {
        if (!std::isalnum(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        if (out.size() == ROOM_CODE_LENGTH) break;
    }
    return out;
}

bool is_valid_room_code(std::string_view code) {
    if (code.size() != ROOM_CODE_LENGTH) return false;
    for (char c : code) {
        bool upper = c >= 'A' && c <= 'Z';
        bool digit = c >= '0' && c <= '9';
        if (!upper && !digit) return false;
    }
    return true;
}

std::string make_frame(std::string_view event, const nlohmann::json& data) {
    nlohmann::json frame{{"event", std::string(event)}, {"data", data}};
    return frame.dump();
}

std::string base64_encode(const std::uint8_t* data, std::size_t length) {
    std::string out;
    out.reserve(((length + 2) / 3) * 4);
    std::size_t i = 0;
    for (; i + 2 < length; i += 3) {
        std::uint32_t n = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(BASE64_ALPHABET[n & 0x3F]);
    }
    std::size_t rest = length - i;
    if (rest == 1) {
        std::uint32_t n = std::uint32_t(data[i]) << 16;
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        std::uint32_t n = (std::uint32_t(data[i]) << 16) | (std::uint32_t(data[i + 1]) << 8);
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) return std::nullopt;
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    for (std::size_t i = 0; i < text.size(); i += 4) {
        bool final_quad = i + 4 == text.size();
        std::array<int, 4> v{};
        int padding = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            if (c == '=') {
                // Padding only in the last two positions of the final quad.
                if (!final_quad || k < 2) return std::nullopt;
                ++padding;
                v[k] = 0;
                continue;
            }
            if (padding > 0) return std::nullopt;
            v[k] = base64_value(c);
            if (v[k] < 0) return std::nullopt;
        }
        std::uint32_t n = (std::uint32_t(v[0]) << 18) | (std::uint32_t(v[1]) << 12) |
                          (std::uint32_t(v[2]) << 6) | std::uint32_t(v[3]);
        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }
    return out;
}

std::string random_room_code() { return random_from(ROOM_ALPHABET, ROOM_CODE_LENGTH); }

std::string random_connection_id() { return random_from(ID_ALPHABET, 20); }

std::string random_hex(std::size_t digits) { return random_from(HEX_ALPHABET, digits); }

} // namespace dropshare
