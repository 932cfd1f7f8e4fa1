#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "protocol.h"

// Helper utilities for building network packets
namespace packet_builder {

template <typename T>
inline void store_be(unsigned char* out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[sizeof(T) - 1 - i] = static_cast<unsigned char>(value & 0xFF);
        value                  = static_cast<T>(value >> 8);
    }
}

template <typename T>
inline T load_be(const unsigned char* in) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | in[i]);
    }
    return value;
}

inline void write_prefix(unsigned char* out, MsgType type) {
    store_be<uint32_t>(out, MAGIC_COOKIE);
    out[sizeof(uint32_t)] = static_cast<uint8_t>(type);
}

inline std::shared_ptr<std::vector<unsigned char>> create_offer_packet(const OfferMsg& offer) {
    auto buf = std::make_shared<std::vector<unsigned char>>(OFFER_SIZE);
    write_prefix(buf->data(), MsgType::OFFER);
    store_be<uint16_t>(buf->data() + MSG_PREFIX_SIZE, offer.udp_port);
    store_be<uint16_t>(buf->data() + MSG_PREFIX_SIZE + sizeof(uint16_t), offer.tcp_port);
    return buf;
}

inline std::shared_ptr<std::vector<unsigned char>> create_request_packet(
    const RequestMsg& request) {
    auto buf = std::make_shared<std::vector<unsigned char>>(REQUEST_SIZE);
    write_prefix(buf->data(), MsgType::REQUEST);
    store_be<uint64_t>(buf->data() + MSG_PREFIX_SIZE, request.file_size);
    return buf;
}

// Writes the 21-byte payload header; the caller places the payload right after it
inline void write_payload_header(unsigned char* out, const PayloadHdr& hdr) {
    write_prefix(out, MsgType::PAYLOAD);
    store_be<uint64_t>(out + MSG_PREFIX_SIZE, hdr.total_segments);
    store_be<uint64_t>(out + MSG_PREFIX_SIZE + sizeof(uint64_t), hdr.segment_number);
}

inline std::shared_ptr<std::vector<unsigned char>> create_payload_packet(
    const PayloadHdr& hdr, const unsigned char* payload, size_t payload_size) {
    auto buf = std::make_shared<std::vector<unsigned char>>(PAYLOAD_HEADER_SIZE + payload_size);
    write_payload_header(buf->data(), hdr);
    if (payload_size > 0) {
        std::memcpy(buf->data() + PAYLOAD_HEADER_SIZE, payload, payload_size);
    }
    return buf;
}

}  // namespace packet_builder
