#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>

#include <asio.hpp>
#include <asio/ip/udp.hpp>

#include "check.hpp"
#include "logger.h"
#include "packet_builder.h"
#include "periodic_timer.h"
#include "protocol.h"
#include "server_config.h"

// Announces the server's UDP and TCP ports once per interval on the discovery port
class OfferBroadcaster {
public:
    using udp = asio::ip::udp;

    OfferBroadcaster(asio::io_context& io_context, uint16_t udp_port, uint16_t tcp_port,
                     udp::endpoint target = udp::endpoint(asio::ip::address_v4::broadcast(),
                                                          DISCOVERY_PORT),
                     std::chrono::steady_clock::duration interval = server_config::OFFER_INTERVAL)
        : socket_(asio::make_strand(io_context)),
          target_(std::move(target)),
          offer_{udp_port, tcp_port},
          timer_(socket_.get_executor(), interval, [this]() { broadcast_offer(); }) {
        std::error_code ec;
        socket_.open(udp::v4(), ec);
        throw_if_err(ec, "broadcast socket open");
        socket_.set_option(asio::socket_base::broadcast(true), ec);
        throw_if_err(ec, "broadcast socket SO_BROADCAST");
    }

    ~OfferBroadcaster() {
        std::error_code ignored;
        socket_.close(ignored);
    }

    OfferBroadcaster(const OfferBroadcaster&)            = delete;
    OfferBroadcaster& operator=(const OfferBroadcaster&) = delete;

    void start() {
        Log::info("Broadcasting offers to {}:{} (udp port {}, tcp port {})",
                  target_.address().to_string(), target_.port(), offer_.udp_port,
                  offer_.tcp_port);
        asio::post(socket_.get_executor(), [this]() { timer_.start(); });
    }

    void stop() {
        asio::post(socket_.get_executor(), [this]() { timer_.stop(); });
    }

    uint64_t offers_sent() const {
        return offers_sent_.load();
    }

private:
    void broadcast_offer() {
        // A failed send is retried by the next tick, one interval later
        auto packet = packet_builder::create_offer_packet(offer_);
        socket_.async_send_to(asio::buffer(*packet), target_,
                              [this, packet](std::error_code error_code, std::size_t) {
                                  if (error_code) {
                                      if (!is_shutdown_error(error_code)) {
                                          Log::error("Error broadcasting offer: {}",
                                                     error_code.message());
                                      }
                                      return;
                                  }
                                  offers_sent_.fetch_add(1);
                              });
    }

    udp::socket           socket_;
    udp::endpoint         target_;
    OfferMsg              offer_;
    PeriodicTimer         timer_;
    std::atomic<uint64_t> offers_sent_{0};
};
