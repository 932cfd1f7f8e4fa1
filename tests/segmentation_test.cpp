#include <array>
#include <cstdint>

#include <gtest/gtest.h>

#include "protocol.h"
#include "tcp_session.h"
#include "transfer_result.h"

TEST(Segmentation, TotalSegmentsRoundsUp) {
    EXPECT_EQ(total_segments(0), 0u);
    EXPECT_EQ(total_segments(1), 1u);
    EXPECT_EQ(total_segments(1023), 1u);
    EXPECT_EQ(total_segments(1024), 1u);
    EXPECT_EQ(total_segments(1025), 2u);
    EXPECT_EQ(total_segments(1048576), 1024u);
}

TEST(Segmentation, SegmentLengthsSumToFileSize) {
    const std::array<uint64_t, 9> sizes{0, 1, 512, 1023, 1024, 1025, 4096, 100000, 1048577};
    for (uint64_t file_size: sizes) {
        uint64_t total = total_segments(file_size);
        uint64_t sum   = 0;
        for (uint64_t n = 0; n < total; ++n) {
            size_t len = segment_payload_size(file_size, n);
            if (n + 1 < total) {
                EXPECT_EQ(len, SEGMENT_SIZE) << file_size << " segment " << n;
            } else {
                EXPECT_GT(len, 0u);
                EXPECT_LE(len, SEGMENT_SIZE);
            }
            sum += len;
        }
        EXPECT_EQ(sum, file_size);
        EXPECT_EQ(segment_payload_size(file_size, total), 0u);
    }
}

TEST(Segmentation, LastSegmentCarriesRemainder) {
    EXPECT_EQ(segment_payload_size(2500, 2), 452u);
    EXPECT_EQ(segment_payload_size(2048, 1), 1024u);
}

TEST(RequestLine, AcceptsPositiveDecimal) {
    EXPECT_EQ(parse_request_line("1048576\n"), 1048576u);
    EXPECT_EQ(parse_request_line("42\r\n"), 42u);
    EXPECT_EQ(parse_request_line("7"), 7u);
}

TEST(RequestLine, RejectsNonPositiveOrGarbage) {
    EXPECT_FALSE(parse_request_line("0\n").has_value());
    EXPECT_FALSE(parse_request_line("-5\n").has_value());
    EXPECT_FALSE(parse_request_line("abc\n").has_value());
    EXPECT_FALSE(parse_request_line("12abc\n").has_value());
    EXPECT_FALSE(parse_request_line("\n").has_value());
    EXPECT_FALSE(parse_request_line("99999999999999999999999\n").has_value());
}

TEST(TransferResult, ThroughputIsBitsPerSecond) {
    EXPECT_DOUBLE_EQ(throughput_bps(1000, 2.0), 4000.0);
    EXPECT_DOUBLE_EQ(throughput_bps(1000, 0.0), 0.0);
}

TEST(TransferResult, FormatsUdpSummaryWithSuccessRate) {
    TransferResult result;
    result.kind             = TransferKind::UDP;
    result.index            = 2;
    result.duration_seconds = 1.5;
    result.throughput_bps   = 12.5e6;
    result.success_rate     = 99.04;
    EXPECT_EQ(format_result(result),
              "UDP transfer #2 finished, total time: 1.50 seconds, total speed: 12.50 Mbps, "
              "percentage of packets received successfully: 99.0%");
}

TEST(TransferResult, FormatsFailure) {
    TransferResult result;
    result.kind  = TransferKind::TCP;
    result.index = 1;
    result.error = "Server refused connection";
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(format_result(result), "TCP transfer #1 failed: Server refused connection");
}
