#pragma once

#include <cstdint>
#include <string>

#include <spdlog/fmt/fmt.h>

enum class TransferKind : uint8_t {
    TCP,
    UDP,
};

inline const char* to_string(TransferKind kind) {
    return kind == TransferKind::TCP ? "TCP" : "UDP";
}

// Summary of one finished transfer task, successful or not
struct TransferResult {
    TransferKind kind  = TransferKind::TCP;
    int          index = 0;  // 1-based within its kind

    double   duration_seconds  = 0.0;
    uint64_t bytes_received    = 0;
    uint64_t segments_received = 0;  // UDP only, unique segments
    uint64_t total_segments    = 0;  // UDP only, 0 when never learned
    double   throughput_bps    = 0.0;
    double   success_rate      = 0.0;  // UDP only, percent

    std::string error;  // empty when the transfer ran to completion

    bool ok() const {
        return error.empty();
    }
};

inline double throughput_bps(uint64_t bytes, double seconds) {
    return seconds > 0.0 ? static_cast<double>(bytes) * 8.0 / seconds : 0.0;
}

// One-line human readable summary
inline std::string format_result(const TransferResult& result) {
    if (!result.ok()) {
        return fmt::format("{} transfer #{} failed: {}", to_string(result.kind), result.index,
                           result.error);
    }
    std::string line =
        fmt::format("{} transfer #{} finished, total time: {:.2f} seconds, total speed: {:.2f} Mbps",
                    to_string(result.kind), result.index, result.duration_seconds,
                    result.throughput_bps / 1e6);
    if (result.kind == TransferKind::UDP) {
        line += fmt::format(", percentage of packets received successfully: {:.1f}%",
                            result.success_rate);
    }
    return line;
}
