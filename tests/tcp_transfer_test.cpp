#include <array>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <asio.hpp>

#include "tcp_transfer.h"
#include "test_support.h"

using asio::ip::tcp;

namespace {

TransferResult run_tcp_transfer(const tcp::endpoint& server, uint64_t file_size,
                                std::chrono::steady_clock::duration connect_timeout = 2s,
                                std::chrono::steady_clock::duration receive_timeout = 2s) {
    asio::io_context              io_context;
    std::optional<TransferResult> result;
    std::make_shared<TcpTransfer>(asio::make_strand(io_context), server, file_size, 1,
                                  [&result](TransferResult r) { result = std::move(r); },
                                  connect_timeout, receive_timeout)
        ->start();
    io_context.run();
    EXPECT_TRUE(result.has_value());
    return result.value_or(TransferResult{});
}

// Sends a request line on a plain socket and counts what comes back until EOF
uint64_t raw_request(uint16_t port, const std::string& line) {
    asio::io_context io_context;
    tcp::socket      socket(io_context);
    socket.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port));
    asio::write(socket, asio::buffer(line));

    uint64_t                   total = 0;
    std::vector<unsigned char> buf(4096);
    for (;;) {
        std::error_code ec;
        std::size_t     n = socket.read_some(asio::buffer(buf), ec);
        total += n;
        if (ec) {
            break;
        }
    }
    return total;
}

uint16_t unused_tcp_port() {
    asio::io_context io_context;
    tcp::acceptor    acceptor(io_context, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    return acceptor.local_endpoint().port();
}

}  // namespace

TEST(TcpSession, SendsExactlyTheRequestedSize) {
    LoopbackServer server;
    EXPECT_EQ(raw_request(server.server().tcp_port(), "5000\n"), 5000u);
    EXPECT_EQ(raw_request(server.server().tcp_port(), "1\n"), 1u);
    EXPECT_EQ(raw_request(server.server().tcp_port(), "3073\n"), 3073u);
}

TEST(TcpSession, RejectsInvalidSizes) {
    LoopbackServer server;
    EXPECT_EQ(raw_request(server.server().tcp_port(), "0\n"), 0u);
    EXPECT_EQ(raw_request(server.server().tcp_port(), "-10\n"), 0u);
    EXPECT_EQ(raw_request(server.server().tcp_port(), "lots\n"), 0u);
}

TEST(TcpSession, ClosesSilentClientsAfterReadTimeout) {
    auto options         = LoopbackServer::loopback_options();
    options.read_timeout = 200ms;
    LoopbackServer server(options);

    asio::io_context io_context;
    tcp::socket      socket(io_context);
    socket.connect(tcp::endpoint(asio::ip::address_v4::loopback(), server.server().tcp_port()));

    auto                  started = std::chrono::steady_clock::now();
    std::array<char, 16>  buf{};
    std::error_code       ec;
    std::size_t           n = socket.read_some(asio::buffer(buf), ec);
    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(ec);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(TcpTransfer, ReceivesFullFile) {
    LoopbackServer server;
    auto           result =
        run_tcp_transfer(tcp::endpoint(asio::ip::address_v4::loopback(), server.server().tcp_port()),
                         1048576);

    EXPECT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.kind, TransferKind::TCP);
    EXPECT_EQ(result.index, 1);
    EXPECT_EQ(result.bytes_received, 1048576u);
    EXPECT_GT(result.duration_seconds, 0.0);
    EXPECT_GT(result.throughput_bps, 0.0);
}

TEST(TcpTransfer, RefusedConnectionIsReportedNotThrown) {
    auto result =
        run_tcp_transfer(tcp::endpoint(asio::ip::address_v4::loopback(), unused_tcp_port()), 100);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, "Server refused connection");
    EXPECT_EQ(result.bytes_received, 0u);
}

TEST(TcpTransfer, EarlyCloseCountsAsShortTransfer) {
    asio::io_context server_io;
    tcp::acceptor    acceptor(server_io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    auto             port = acceptor.local_endpoint().port();

    std::thread peer([&acceptor]() {
        tcp::socket socket = acceptor.accept();
        std::string line;
        asio::read_until(socket, asio::dynamic_buffer(line), '\n');
        std::vector<unsigned char> partial(100, 0x11);
        asio::write(socket, asio::buffer(partial));
        socket.close();
    });

    auto result = run_tcp_transfer(tcp::endpoint(asio::ip::address_v4::loopback(), port), 1000);
    peer.join();

    EXPECT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.bytes_received, 100u);
}

TEST(TcpTransfer, StalledServerEndsWithReceiveTimeout) {
    asio::io_context server_io;
    tcp::acceptor    acceptor(server_io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
    auto             port = acceptor.local_endpoint().port();

    std::promise<void> release;
    std::thread        peer([&acceptor, done = release.get_future()]() {
        tcp::socket socket = acceptor.accept();
        std::string line;
        asio::read_until(socket, asio::dynamic_buffer(line), '\n');
        std::vector<unsigned char> partial(100, 0x22);
        asio::write(socket, asio::buffer(partial));
        // Keep the connection open and silent until the client has given up
        done.wait_for(10s);
    });

    auto started = std::chrono::steady_clock::now();
    auto result  = run_tcp_transfer(tcp::endpoint(asio::ip::address_v4::loopback(), port), 1000,
                                    2s, 300ms);
    auto elapsed = std::chrono::steady_clock::now() - started;
    release.set_value();
    peer.join();

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, "Receive timed out");
    EXPECT_EQ(result.bytes_received, 100u);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 3s);
}

TEST(TcpSession, ClosesClientsThatStopReading) {
    auto options         = LoopbackServer::loopback_options();
    options.send_timeout = 200ms;
    LoopbackServer server(options);

    const uint64_t   requested = 1000000000;
    asio::io_context io_context;
    tcp::socket      socket(io_context);
    socket.connect(tcp::endpoint(asio::ip::address_v4::loopback(), server.server().tcp_port()));
    asio::write(socket, asio::buffer(std::to_string(requested) + "\n"));

    // Socket buffers fill up, the server's write stalls and its deadline fires
    std::this_thread::sleep_for(1s);

    auto                       started = std::chrono::steady_clock::now();
    uint64_t                   total   = 0;
    std::vector<unsigned char> buf(64 * 1024);
    for (;;) {
        std::error_code ec;
        total += socket.read_some(asio::buffer(buf), ec);
        if (ec) {
            break;
        }
    }

    EXPECT_GT(total, 0u);
    EXPECT_LT(total, requested);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
