#pragma once
// =============================================================================
// SimPilot - Base64 (agent clipboard / screenshot / recording payloads)
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace simpilot {

static const char BASE64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result.push_back(BASE64_TABLE[(n >> 18) & 0x3F]);
        result.push_back(BASE64_TABLE[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? BASE64_TABLE[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? BASE64_TABLE[n & 0x3F] : '=');
    }
    return result;
}

inline std::string base64Encode(const std::string& text) {
    return base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// Whitespace (the agent wraps long payloads) is skipped; any other
// character outside the alphabet makes the input invalid.
inline std::optional<std::vector<uint8_t>> base64Decode(const std::string& encoded) {
    auto sextet = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    };

    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    uint32_t buffer = 0;
    int bits = 0;
    bool padding = false;
    for (char c : encoded) {
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int v = sextet(c);
        if (v < 0 || padding) return std::nullopt;
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace simpilot
