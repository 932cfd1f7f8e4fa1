#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include "check.hpp"
#include "client_config.h"
#include "logger.h"
#include "message_validator.h"
#include "protocol.h"

// Where an offer came from and what it announced
struct DiscoveredServer {
    asio::ip::address address;
    uint16_t          udp_port = 0;
    uint16_t          tcp_port = 0;
};

// Waits on the discovery port for a valid Offer
class OfferListener {
public:
    using udp = asio::ip::udp;
#ifdef SO_REUSEPORT
    // Several clients on one host share the discovery port
    using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
#endif

    explicit OfferListener(uint16_t port = DISCOVERY_PORT) : socket_(io_context_) {
        std::error_code ec;
        socket_.open(udp::v4(), ec);
        throw_if_err(ec, "discovery socket open");
        socket_.set_option(asio::socket_base::reuse_address(true), ec);
        throw_if_err(ec, "discovery socket SO_REUSEADDR");
#ifdef SO_REUSEPORT
        socket_.set_option(reuse_port(true), ec);
        throw_if_err(ec, "discovery socket SO_REUSEPORT");
#endif
        socket_.bind(udp::endpoint(udp::v4(), port), ec);
        throw_if_err(ec, "discovery socket bind");
    }

    OfferListener(const OfferListener&)            = delete;
    OfferListener& operator=(const OfferListener&) = delete;

    uint16_t local_port() const {
        return socket_.local_endpoint().port();
    }

    // Blocks until a valid Offer arrives or the timeout elapses. Invalid datagrams
    // are dropped and do not extend the deadline.
    std::optional<DiscoveredServer> wait_for_offer(
        std::chrono::steady_clock::duration timeout = client_config::OFFER_TIMEOUT) {
        if (aborted_) {
            return std::nullopt;
        }
        result_.reset();
        timed_out_ = false;
        io_context_.restart();

        asio::steady_timer deadline(io_context_);
        deadline.expires_after(timeout);
        deadline.async_wait([this](std::error_code error_code) {
            if (error_code) {
                return;  // cancelled because an offer arrived
            }
            timed_out_ = true;
            socket_.cancel();
        });

        do_receive(deadline);
        io_context_.run();

        if (timed_out_) {
            Log::debug("No offer received within {} ms",
                       std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
        }
        return result_;
    }

    // Ends the current wait (from any thread) and makes every later wait return at once
    void abort() {
        aborted_ = true;
        asio::post(io_context_, [this]() {
            std::error_code ignored;
            socket_.cancel(ignored);
            io_context_.stop();
        });
    }

private:
    void do_receive(asio::steady_timer& deadline) {
        socket_.async_receive_from(
            asio::buffer(recv_buf_), sender_,
            [this, &deadline](std::error_code error_code, std::size_t bytes) {
                if (error_code == asio::error::operation_aborted) {
                    return;
                }
                if (error_code) {
                    Log::warn("Error receiving offer: {}", error_code.message());
                    if (!timed_out_) {
                        do_receive(deadline);
                    }
                    return;
                }

                auto offer = message_validator::parse_offer(recv_buf_.data(), bytes);
                if (!offer) {
                    Log::debug("Ignoring {} byte datagram from {}:{}", bytes,
                               sender_.address().to_string(), sender_.port());
                    if (!timed_out_) {
                        do_receive(deadline);
                    }
                    return;
                }

                result_ = DiscoveredServer{sender_.address(), offer->udp_port, offer->tcp_port};
                deadline.cancel();
            });
    }

    asio::io_context                 io_context_;
    udp::socket                      socket_;
    udp::endpoint                    sender_;
    std::array<unsigned char, 1024>  recv_buf_{};
    std::optional<DiscoveredServer>  result_;
    bool                             timed_out_ = false;
    std::atomic<bool>                aborted_{false};
};
