#pragma once

#include <cstddef>
#include <cstdint>

// Wire constants shared by the client and server roles

constexpr uint32_t MAGIC_COOKIE = 0xABCDDCBA;

enum class MsgType : uint8_t {
    OFFER   = 0x02,
    REQUEST = 0x03,
    PAYLOAD = 0x04,
};

constexpr uint16_t DISCOVERY_PORT = 13117;

constexpr size_t SEGMENT_SIZE   = 1024;  // UDP payload bytes per segment
constexpr size_t TCP_CHUNK_SIZE = 1024;  // bytes per TCP write on the server

// Encoded sizes (all integers big-endian)
constexpr size_t MSG_PREFIX_SIZE     = sizeof(uint32_t) + sizeof(uint8_t);
constexpr size_t OFFER_SIZE          = MSG_PREFIX_SIZE + 2 * sizeof(uint16_t);  // 9
constexpr size_t REQUEST_SIZE        = MSG_PREFIX_SIZE + sizeof(uint64_t);      // 13
constexpr size_t PAYLOAD_HEADER_SIZE = MSG_PREFIX_SIZE + 2 * sizeof(uint64_t);  // 21
constexpr size_t MAX_PAYLOAD_PACKET  = PAYLOAD_HEADER_SIZE + SEGMENT_SIZE;

static_assert(OFFER_SIZE == 9);
static_assert(REQUEST_SIZE == 13);
static_assert(PAYLOAD_HEADER_SIZE == 21);

struct OfferMsg {
    uint16_t udp_port;
    uint16_t tcp_port;
};

struct RequestMsg {
    uint64_t file_size;
};

struct PayloadHdr {
    uint64_t total_segments;
    uint64_t segment_number;
};

// Number of UDP segments needed to carry file_size bytes
constexpr uint64_t total_segments(uint64_t file_size) {
    return file_size / SEGMENT_SIZE + (file_size % SEGMENT_SIZE != 0 ? 1 : 0);
}

// Payload length of one segment; only the last segment may be short
constexpr size_t segment_payload_size(uint64_t file_size, uint64_t segment_number) {
    if (segment_number >= total_segments(file_size)) {
        return 0;
    }
    uint64_t offset = segment_number * SEGMENT_SIZE;
    uint64_t left   = file_size - offset;
    return left < SEGMENT_SIZE ? static_cast<size_t>(left) : SEGMENT_SIZE;
}
