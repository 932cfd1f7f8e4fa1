#include <gtest/gtest.h>

#include "client_config.h"

TEST(ClientConfig, AcceptsValidConfiguration) {
    ClientConfig config{1048576, 1, 1};
    EXPECT_FALSE(config.validate().has_value());

    ClientConfig tcp_only{1, 3, 0};
    EXPECT_FALSE(tcp_only.validate().has_value());

    ClientConfig udp_only{1, 0, 2};
    EXPECT_FALSE(udp_only.validate().has_value());
}

TEST(ClientConfig, RejectsZeroFileSize) {
    ClientConfig config{0, 1, 1};
    ASSERT_TRUE(config.validate().has_value());
    EXPECT_EQ(*config.validate(), "File size must be positive");
}

TEST(ClientConfig, RejectsNegativeCounts) {
    EXPECT_TRUE((ClientConfig{10, -1, 2}).validate().has_value());
    EXPECT_TRUE((ClientConfig{10, 2, -1}).validate().has_value());
}

TEST(ClientConfig, RejectsZeroConnections) {
    ClientConfig config{10, 0, 0};
    ASSERT_TRUE(config.validate().has_value());
    EXPECT_EQ(*config.validate(), "Must have at least one connection");
}

TEST(SizeLiteral, PlainBytes) {
    EXPECT_EQ(parse_size_literal("1048576"), 1048576u);
    EXPECT_EQ(parse_size_literal("  512 "), 512u);
    EXPECT_EQ(parse_size_literal("0"), 0u);
    EXPECT_EQ(parse_size_literal("100B"), 100u);
}

TEST(SizeLiteral, DecimalAndBinaryUnits) {
    EXPECT_EQ(parse_size_literal("1KB"), 1000u);
    EXPECT_EQ(parse_size_literal("1kib"), 1024u);
    EXPECT_EQ(parse_size_literal("1.5MB"), 1500000u);
    EXPECT_EQ(parse_size_literal("1MiB"), 1048576u);
    EXPECT_EQ(parse_size_literal("2 GiB"), 2147483648u);
    EXPECT_EQ(parse_size_literal("1gb"), 1000000000u);
}

TEST(SizeLiteral, RejectsGarbage) {
    EXPECT_FALSE(parse_size_literal("").has_value());
    EXPECT_FALSE(parse_size_literal("abc").has_value());
    EXPECT_FALSE(parse_size_literal("-5").has_value());
    EXPECT_FALSE(parse_size_literal("10 parsecs").has_value());
    EXPECT_FALSE(parse_size_literal("1e30").has_value());
}

TEST(ParseCount, StrictIntegers) {
    EXPECT_EQ(parse_count("3"), 3);
    EXPECT_EQ(parse_count(" 0 "), 0);
    EXPECT_EQ(parse_count("-2"), -2);  // rejected later by validate()
    EXPECT_FALSE(parse_count("2.5").has_value());
    EXPECT_FALSE(parse_count("").has_value());
    EXPECT_FALSE(parse_count("x").has_value());
}
