#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include "client_config.h"
#include "logger.h"
#include "message_validator.h"
#include "packet_builder.h"
#include "protocol.h"
#include "transfer_result.h"

// Client side of one UDP transfer. The protocol has no end-of-transfer message:
// the transfer is over once no datagram has arrived for the inactivity timeout.
class UdpTransfer : public std::enable_shared_from_this<UdpTransfer> {
public:
    using udp           = asio::ip::udp;
    using clock         = std::chrono::steady_clock;
    using FinishHandler = std::function<void(TransferResult)>;

    UdpTransfer(asio::any_io_executor executor, udp::endpoint server, uint64_t file_size,
                int index, FinishHandler on_finish,
                clock::duration inactivity_timeout = client_config::UDP_INACTIVITY_TIMEOUT)
        : socket_(executor),
          inactivity_deadline_(executor),
          server_(std::move(server)),
          file_size_(file_size),
          inactivity_timeout_(inactivity_timeout),
          on_finish_cb_(std::move(on_finish)) {
        result_.kind  = TransferKind::UDP;
        result_.index = index;
    }

    void start() {
        asio::dispatch(socket_.get_executor(),
                       [self = shared_from_this()]() { self->send_request(); });
    }

private:
    void send_request() {
        std::error_code ec;
        socket_.open(udp::v4(), ec);
        if (ec) {
            fail("Opening socket failed: " + ec.message());
            return;
        }
        socket_.set_option(asio::socket_base::receive_buffer_size(client_config::UDP_SOCKET_RCVBUF),
                           ec);
        if (ec) {
            Log::debug("UDP transfer #{}: could not enlarge receive buffer: {}", result_.index,
                       ec.message());
        }

        request_    = packet_builder::create_request_packet(RequestMsg{file_size_});
        started_at_ = clock::now();
        socket_.async_send_to(asio::buffer(*request_), server_,
                              [self = shared_from_this()](std::error_code error_code, std::size_t) {
                                  if (error_code) {
                                      self->fail("Sending request failed: " +
                                                 error_code.message());
                                      return;
                                  }
                                  self->arm_deadline();
                                  self->do_receive();
                              });
    }

    void arm_deadline() {
        inactivity_deadline_.expires_after(inactivity_timeout_);
        inactivity_deadline_.async_wait(
            [self = shared_from_this()](std::error_code error_code) {
                self->check_deadline(error_code);
            });
    }

    // The deadline is pushed forward by every arrival, so a firing timer may be stale
    void check_deadline(std::error_code error_code) {
        if (finished_) {
            return;
        }
        if (error_code && error_code != asio::error::operation_aborted) {
            Log::error("UDP transfer #{} timer error: {}", result_.index, error_code.message());
        }
        if (inactivity_deadline_.expiry() <= clock::now()) {
            finish();
            return;
        }
        inactivity_deadline_.async_wait(
            [self = shared_from_this()](std::error_code next_error) {
                self->check_deadline(next_error);
            });
    }

    void do_receive() {
        socket_.async_receive_from(
            asio::buffer(recv_buf_), sender_,
            [self = shared_from_this()](std::error_code error_code, std::size_t bytes) {
                self->on_receive(error_code, bytes);
            });
    }

    void on_receive(std::error_code error_code, std::size_t bytes) {
        if (finished_) {
            return;
        }
        if (error_code == asio::error::operation_aborted) {
            return;
        }
        if (error_code) {
            Log::debug("UDP transfer #{} receive error: {}", result_.index, error_code.message());
            do_receive();
            return;
        }

        // Any datagram, valid or not, counts as activity. expires_after() cancels the
        // pending wait, whose handler then re-arms against the new expiry.
        inactivity_deadline_.expires_after(inactivity_timeout_);

        if (auto segment = message_validator::parse_payload(recv_buf_.data(), bytes)) {
            on_segment(*segment);
        }
        do_receive();
    }

    void on_segment(const message_validator::PayloadView& segment) {
        if (result_.total_segments == 0) {
            result_.total_segments = segment.hdr.total_segments;
        }
        if (segment.hdr.segment_number >= result_.total_segments) {
            return;  // outside the announced range
        }
        if (seen_.insert(segment.hdr.segment_number).second) {
            result_.bytes_received += segment.size;
        }
    }

    void finish() {
        finished_ = true;
        std::chrono::duration<double> elapsed = clock::now() - started_at_;
        result_.duration_seconds  = elapsed.count();
        result_.segments_received = seen_.size();
        result_.throughput_bps    = throughput_bps(result_.bytes_received, result_.duration_seconds);
        result_.success_rate =
            result_.total_segments > 0
                ? static_cast<double>(result_.segments_received) * 100.0 /
                      static_cast<double>(result_.total_segments)
                : 0.0;
        close_and_report();
    }

    void fail(std::string reason) {
        finished_ = true;
        Log::warn("UDP transfer #{} to {}:{} failed: {}", result_.index,
                  server_.address().to_string(), server_.port(), reason);
        result_.error = std::move(reason);
        close_and_report();
    }

    void close_and_report() {
        std::error_code ignored;
        inactivity_deadline_.cancel();
        socket_.close(ignored);
        if (on_finish_cb_) {
            on_finish_cb_(result_);
        }
    }

    udp::socket                                 socket_;
    asio::steady_timer                          inactivity_deadline_;
    udp::endpoint                               server_;
    udp::endpoint                               sender_;
    uint64_t                                    file_size_;
    clock::duration                             inactivity_timeout_;
    FinishHandler                               on_finish_cb_;
    std::shared_ptr<std::vector<unsigned char>> request_;
    std::unordered_set<uint64_t>                seen_;  // segment numbers already counted
    clock::time_point                           started_at_{};
    bool                                        finished_ = false;
    TransferResult                              result_;

    std::array<unsigned char, client_config::UDP_RECV_BUF_SIZE> recv_buf_{};
};
