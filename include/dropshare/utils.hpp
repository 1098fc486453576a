#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dropshare {

// Every listed key must be present with the given type; extra keys are allowed.
// Types: "string", "number", "integer", "boolean", "object", "array", "any".
inline bool validate_schema(const nlohmann::json& j,
                            std::initializer_list<std::pair<std::string, std::string>> fields) {
    if (!j.is_object()) return false;
    for (auto& [key, type] : fields) {
        auto it = j.find(key);
        if (it == j.end()) return false;
        if (type == "string" && !it->is_string()) return false;
        if (type == "number" && !it->is_number()) return false;
        if (type == "integer" && !it->is_number_integer()) return false;
        if (type == "boolean" && !it->is_boolean()) return false;
        if (type == "object" && !it->is_object()) return false;
        if (type == "array" && !it->is_array()) return false;
    }
    return true;
}

// A chunk index or count: a non-negative integer that fits in 32 bits.
inline std::optional<std::uint32_t> json_index(const nlohmann::json& j) {
    if (j.is_number_unsigned()) {
        auto v = j.get<std::uint64_t>();
        if (v > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
        return static_cast<std::uint32_t>(v);
    }
    if (!j.is_number_integer()) return std::nullopt;
    auto v = j.get<std::int64_t>();
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

// Keeps [A-Za-z0-9], uppercases, truncates to six characters.
std::string sanitize_room_code(std::string_view raw);

bool is_valid_room_code(std::string_view code);

std::string make_frame(std::string_view event, const nlohmann::json& data);

std::string base64_encode(const std::uint8_t* data, std::size_t length);
inline std::string base64_encode(const std::vector<std::uint8_t>& bytes) {
    return base64_encode(bytes.data(), bytes.size());
}

// Returns std::nullopt on any character outside the standard alphabet or bad padding.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

// Random string drawn from [A-Z0-9] (room codes) or [A-Za-z0-9_-] (connection ids).
std::string random_room_code();
std::string random_connection_id();
std::string random_hex(std::size_t digits);

} // namespace dropshare
