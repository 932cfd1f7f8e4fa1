#pragma once

#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

using namespace std::chrono_literals;

namespace client_config {
constexpr auto   OFFER_TIMEOUT          = 10s;
constexpr auto   CONNECT_TIMEOUT        = 10s;
constexpr auto   RECEIVE_TIMEOUT        = 10s;  // per read once connected
constexpr auto   UDP_INACTIVITY_TIMEOUT = 1s;
constexpr auto   DISCOVERY_RETRY_DELAY  = 1s;
constexpr size_t TCP_READ_BUF_SIZE      = 64 * 1024;
constexpr size_t UDP_RECV_BUF_SIZE      = 2048;
constexpr int    UDP_SOCKET_RCVBUF      = 1024 * 1024;
}  // namespace client_config

// Standing parameters reused for every discovery cycle
struct ClientConfig {
    uint64_t file_size = 0;
    int      tcp_count = 0;
    int      udp_count = 0;

    // Returns the reason the configuration is rejected, or nullopt when it is usable
    std::optional<std::string> validate() const {
        if (file_size == 0) {
            return "File size must be positive";
        }
        if (tcp_count < 0) {
            return "TCP connections cannot be negative";
        }
        if (udp_count < 0) {
            return "UDP connections cannot be negative";
        }
        if (tcp_count + udp_count == 0) {
            return "Must have at least one connection";
        }
        return std::nullopt;
    }
};

// Parses "4096", "1.5MB", "1MiB", "10 kb". Suffixes are case-insensitive;
// decimal units are powers of 1000, binary units powers of 1024.
inline std::optional<uint64_t> parse_size_literal(std::string_view literal) {
    while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.front()))) {
        literal.remove_prefix(1);
    }
    while (!literal.empty() && std::isspace(static_cast<unsigned char>(literal.back()))) {
        literal.remove_suffix(1);
    }
    if (literal.empty() || literal.front() == '-' || literal.front() == '+') {
        return std::nullopt;
    }

    double      value = 0.0;
    const char* first = literal.data();
    const char* last  = literal.data() + literal.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);
    if (ec != std::errc() || !std::isfinite(value)) {
        return std::nullopt;
    }

    std::string unit;
    for (const char* p = ptr; p != last; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p))) {
            unit.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
        }
    }

    double multiplier = 0.0;
    if (unit.empty() || unit == "b")
        multiplier = 1.0;
    else if (unit == "kb")
        multiplier = 1e3;
    else if (unit == "kib")
        multiplier = 1024.0;
    else if (unit == "mb")
        multiplier = 1e6;
    else if (unit == "mib")
        multiplier = 1024.0 * 1024.0;
    else if (unit == "gb")
        multiplier = 1e9;
    else if (unit == "gib")
        multiplier = 1024.0 * 1024.0 * 1024.0;
    else
        return std::nullopt;

    double bytes = std::ceil(value * multiplier);
    if (bytes > 1.8e19) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

// Strict non-negative decimal integer for connection counts
inline std::optional<int> parse_count(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    int value      = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}
