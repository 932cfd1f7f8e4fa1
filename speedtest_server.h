#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

#include <asio.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ip/udp.hpp>

#include "check.hpp"
#include "logger.h"
#include "message_validator.h"
#include "offer_broadcaster.h"
#include "protocol.h"
#include "server_config.h"
#include "tcp_session.h"
#include "udp_segment_sender.h"

// Best-effort primary IPv4 address of this host, for the startup banner
inline std::string local_ip_address(asio::io_context& io_context) {
    std::error_code         ec;
    asio::ip::udp::resolver resolver(io_context);
    auto results = resolver.resolve(asio::ip::udp::v4(), asio::ip::host_name(), "", ec);
    if (ec) {
        return "0.0.0.0";
    }
    std::string fallback = "127.0.0.1";
    for (const auto& entry: results) {
        auto address = entry.endpoint().address();
        if (!address.is_loopback()) {
            return address.to_string();
        }
        fallback = address.to_string();
    }
    return fallback;
}

struct ServerOptions {
    using duration = std::chrono::steady_clock::duration;

    uint16_t                tcp_port = 0;  // 0 picks an ephemeral port
    uint16_t                udp_port = 0;
    asio::ip::udp::endpoint offer_target =
        asio::ip::udp::endpoint(asio::ip::address_v4::broadcast(), DISCOVERY_PORT);
    duration offer_interval = server_config::OFFER_INTERVAL;
    duration udp_pacing     = server_config::UDP_SEND_PACING;
    duration read_timeout   = server_config::REQUEST_READ_TIMEOUT;
    duration send_timeout   = server_config::SEND_TIMEOUT;
};

// Speed test server: TCP accept loop, UDP request loop and offer broadcaster, all
// running concurrently on one io_context. Every accepted connection and every valid
// request gets its own session; there is no limit on how many run at once.
class SpeedTestServer {
public:
    using tcp = asio::ip::tcp;
    using udp = asio::ip::udp;

    SpeedTestServer(asio::io_context& io_context, const ServerOptions& options = {})
        : io_context_(io_context),
          options_(options),
          acceptor_(asio::make_strand(io_context), tcp::endpoint(tcp::v4(), options.tcp_port)),
          udp_socket_(asio::make_strand(io_context), udp::endpoint(udp::v4(), options.udp_port)),
          broadcaster_(io_context, udp_socket_.local_endpoint().port(),
                       acceptor_.local_endpoint().port(), options.offer_target,
                       options.offer_interval) {}

    ~SpeedTestServer() {
        std::error_code ignored;
        acceptor_.close(ignored);
        udp_socket_.close(ignored);
    }

    SpeedTestServer(const SpeedTestServer&)            = delete;
    SpeedTestServer& operator=(const SpeedTestServer&) = delete;

    void start() {
        Log::info("Server started, listening on IP address {}", local_ip_address(io_context_));
        Log::info("TCP port {}, UDP port {}", tcp_port(), udp_port());
        asio::dispatch(acceptor_.get_executor(), [this]() { do_accept(); });
        asio::dispatch(udp_socket_.get_executor(), [this]() { do_receive(); });
        broadcaster_.start();
    }

    void stop() {
        broadcaster_.stop();
        asio::post(acceptor_.get_executor(), [this]() {
            std::error_code ignored;
            acceptor_.close(ignored);
        });
        asio::post(udp_socket_.get_executor(), [this]() {
            std::error_code ignored;
            udp_socket_.close(ignored);
        });
    }

    uint16_t tcp_port() const {
        return acceptor_.local_endpoint().port();
    }

    uint16_t udp_port() const {
        return udp_socket_.local_endpoint().port();
    }

    uint64_t tcp_sessions_started() const {
        return tcp_sessions_.load();
    }

    uint64_t udp_sessions_started() const {
        return udp_sessions_.load();
    }

    uint64_t offers_sent() const {
        return broadcaster_.offers_sent();
    }

private:
    void do_accept() {
        // Each connection gets its own strand so sessions can run on any pool thread
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](std::error_code error_code, tcp::socket socket) {
                                   if (is_shutdown_error(error_code)) {
                                       return;
                                   }
                                   if (error_code) {
                                       Log::error("Error accepting TCP connection: {}",
                                                  error_code.message());
                                   } else {
                                       tcp_sessions_.fetch_add(1);
                                       std::make_shared<TcpSession>(std::move(socket),
                                                                    options_.read_timeout,
                                                                    options_.send_timeout)
                                           ->start();
                                   }
                                   do_accept();
                               });
    }

    void do_receive() {
        udp_socket_.async_receive_from(
            asio::buffer(recv_buf_), remote_endpoint_,
            [this](std::error_code error_code, std::size_t bytes) { on_receive(error_code, bytes); });
    }

    void on_receive(std::error_code error_code, std::size_t bytes) {
        if (is_shutdown_error(error_code)) {
            return;
        }
        if (error_code) {
            Log::error("Network error receiving UDP request: {}", error_code.message());
            do_receive();
            return;
        }

        auto request = message_validator::parse_request(recv_buf_.data(), bytes);
        if (!request) {
            Log::debug("Received invalid UDP packet ({} bytes) from {}:{}", bytes,
                       remote_endpoint_.address().to_string(), remote_endpoint_.port());
            do_receive();
            return;
        }

        udp_sessions_.fetch_add(1);
        std::make_shared<UdpSegmentSender>(udp_socket_, remote_endpoint_, request->file_size,
                                           options_.udp_pacing)
            ->start();
        do_receive();
    }

    asio::io_context& io_context_;
    ServerOptions     options_;
    tcp::acceptor     acceptor_;
    udp::socket       udp_socket_;
    OfferBroadcaster  broadcaster_;

    std::array<unsigned char, server_config::RECV_BUF_SIZE> recv_buf_{};
    udp::endpoint                                           remote_endpoint_;

    std::atomic<uint64_t> tcp_sessions_{0};
    std::atomic<uint64_t> udp_sessions_{0};
};
