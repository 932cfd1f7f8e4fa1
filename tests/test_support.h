#pragma once

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "offer_listener.h"
#include "speedtest_server.h"

using namespace std::chrono_literals;

// In-process server on loopback, driven by a small thread pool for the test's lifetime
class LoopbackServer {
public:
    explicit LoopbackServer(ServerOptions options = loopback_options(), unsigned threads = 2)
        : server_(std::make_unique<SpeedTestServer>(io_context_, options)) {
        server_->start();
        for (unsigned i = 0; i < threads; ++i) {
            pool_.emplace_back([this]() { io_context_.run(); });
        }
    }

    ~LoopbackServer() {
        server_->stop();
        io_context_.stop();
        for (auto& thread: pool_) {
            thread.join();
        }
        server_.reset();
    }

    SpeedTestServer& server() {
        return *server_;
    }

    DiscoveredServer as_offer() const {
        return DiscoveredServer{asio::ip::address_v4::loopback(), server_->udp_port(),
                                server_->tcp_port()};
    }

    // Offers go to an unused loopback port unless a test points them somewhere
    static ServerOptions loopback_options(uint16_t offer_port = 9) {
        ServerOptions options;
        options.offer_target =
            asio::ip::udp::endpoint(asio::ip::address_v4::loopback(), offer_port);
        return options;
    }

private:
    asio::io_context                 io_context_;
    std::unique_ptr<SpeedTestServer> server_;
    std::vector<std::thread>         pool_;
};
