#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include "check.hpp"
#include "logger.h"
#include "packet_builder.h"
#include "payload_source.h"
#include "protocol.h"
#include "server_config.h"

// Streams one UDP transfer: segments 0..total-1 to the requester, paced by a fixed
// delay. Lost segments are not retransmitted. The socket is shared with the request
// receiver and every other sender, so all handlers run on the socket's strand.
class UdpSegmentSender : public std::enable_shared_from_this<UdpSegmentSender> {
public:
    using udp = asio::ip::udp;

    UdpSegmentSender(udp::socket& socket, udp::endpoint client, uint64_t file_size,
                     std::chrono::steady_clock::duration pacing = server_config::UDP_SEND_PACING)
        : socket_(socket),
          pace_timer_(socket.get_executor()),
          client_(std::move(client)),
          file_size_(file_size),
          total_segments_(total_segments(file_size)),
          pacing_(pacing),
          packet_(MAX_PAYLOAD_PACKET) {}

    void start() {
        Log::info("UDP client {}:{} requested {} bytes ({} segments)",
                  client_.address().to_string(), client_.port(), file_size_, total_segments_);
        asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() { self->send_next(); });
    }

private:
    void send_next() {
        if (next_segment_ >= total_segments_) {
            Log::debug("UDP client {}:{} sent all {} segments", client_.address().to_string(),
                       client_.port(), total_segments_);
            return;
        }

        std::size_t payload_size = segment_payload_size(file_size_, next_segment_);
        packet_builder::write_payload_header(packet_.data(), {total_segments_, next_segment_});
        payload_.fill(packet_.data() + PAYLOAD_HEADER_SIZE, payload_size);

        socket_.async_send_to(
            asio::buffer(packet_.data(), PAYLOAD_HEADER_SIZE + payload_size), client_,
            [self = shared_from_this()](std::error_code error_code, std::size_t) {
                if (is_shutdown_error(error_code)) {
                    return;
                }
                if (error_code) {
                    // The segment is lost; the client accounts for it in its success rate
                    Log::error("Error handling UDP client {}:{}: segment {}: {}",
                               self->client_.address().to_string(), self->client_.port(),
                               self->next_segment_, error_code.message());
                }
                ++self->next_segment_;
                self->pace_timer_.expires_after(self->pacing_);
                self->pace_timer_.async_wait([self](std::error_code timer_error) {
                    if (timer_error) {
                        return;
                    }
                    self->send_next();
                });
            });
    }

    udp::socket&                        socket_;
    asio::steady_timer                  pace_timer_;
    udp::endpoint                       client_;
    uint64_t                            file_size_;
    uint64_t                            total_segments_;
    std::chrono::steady_clock::duration pacing_;
    std::vector<unsigned char>          packet_;
    PayloadSource                       payload_;
    uint64_t                            next_segment_ = 0;
};
