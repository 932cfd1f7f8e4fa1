#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "packet_builder.h"
#include "protocol.h"

// Decoding of received datagrams. A std::nullopt result means "not a message of this
// kind" and the caller keeps waiting; malformed input is never an error.
namespace message_validator {

struct PayloadView {
    PayloadHdr           hdr;
    const unsigned char* data;
    size_t               size;
};

inline bool has_valid_prefix(const unsigned char* data, size_t bytes, MsgType expected) {
    if (data == nullptr || bytes < MSG_PREFIX_SIZE) {
        return false;
    }
    return packet_builder::load_be<uint32_t>(data) == MAGIC_COOKIE &&
           data[sizeof(uint32_t)] == static_cast<uint8_t>(expected);
}

inline std::optional<OfferMsg> parse_offer(const unsigned char* data, size_t bytes) {
    if (bytes < OFFER_SIZE || !has_valid_prefix(data, bytes, MsgType::OFFER)) {
        return std::nullopt;
    }
    OfferMsg offer{};
    offer.udp_port = packet_builder::load_be<uint16_t>(data + MSG_PREFIX_SIZE);
    offer.tcp_port = packet_builder::load_be<uint16_t>(data + MSG_PREFIX_SIZE + sizeof(uint16_t));
    return offer;
}

inline std::optional<RequestMsg> parse_request(const unsigned char* data, size_t bytes) {
    if (bytes < REQUEST_SIZE || !has_valid_prefix(data, bytes, MsgType::REQUEST)) {
        return std::nullopt;
    }
    return RequestMsg{packet_builder::load_be<uint64_t>(data + MSG_PREFIX_SIZE)};
}

// Payload bytes are everything after the header; the view borrows from data
inline std::optional<PayloadView> parse_payload(const unsigned char* data, size_t bytes) {
    if (bytes < PAYLOAD_HEADER_SIZE || !has_valid_prefix(data, bytes, MsgType::PAYLOAD)) {
        return std::nullopt;
    }
    PayloadView view{};
    view.hdr.total_segments = packet_builder::load_be<uint64_t>(data + MSG_PREFIX_SIZE);
    view.hdr.segment_number =
        packet_builder::load_be<uint64_t>(data + MSG_PREFIX_SIZE + sizeof(uint64_t));
    view.data = data + PAYLOAD_HEADER_SIZE;
    view.size = bytes - PAYLOAD_HEADER_SIZE;
    return view;
}

}  // namespace message_validator
