#pragma once

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <asio.hpp>

#include "check.hpp"
#include "logger.h"
#include "payload_source.h"
#include "protocol.h"
#include "server_config.h"

// Parses the client's request line ("<decimal size>\n"). Only strictly positive
// decimal integers are accepted.
inline std::optional<uint64_t> parse_request_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && line.front() == ' ') {
        line.remove_prefix(1);
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (line.empty() || ec != std::errc() || ptr != line.data() + line.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

// Server side of one TCP transfer. Lives as long as an async operation holds it.
class TcpSession : public std::enable_shared_from_this<TcpSession> {
public:
    using tcp = asio::ip::tcp;

    explicit TcpSession(
        tcp::socket                         socket,
        std::chrono::steady_clock::duration read_timeout = server_config::REQUEST_READ_TIMEOUT,
        std::chrono::steady_clock::duration send_timeout = server_config::SEND_TIMEOUT)
        : socket_(std::move(socket)), io_deadline_(socket_.get_executor()),
          read_timeout_(read_timeout), send_timeout_(send_timeout) {
        std::error_code ec;
        auto            remote = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string("unknown peer")
                   : remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    void start() {
        asio::dispatch(socket_.get_executor(),
                       [self = shared_from_this()]() { self->read_request(); });
    }

private:
    void read_request() {
        arm_deadline(read_timeout_, "sent no request");

        asio::async_read_until(
            socket_, asio::dynamic_buffer(line_, server_config::MAX_REQUEST_LINE), '\n',
            [self = shared_from_this()](std::error_code error_code, std::size_t length) {
                self->io_deadline_.cancel();
                self->on_request(error_code, length);
            });
    }

    void on_request(std::error_code error_code, std::size_t length) {
        if (error_code) {
            if (!is_shutdown_error(error_code)) {
                Log::error("Error handling TCP client {}: {}", peer_, error_code.message());
            }
            close();
            return;
        }

        auto file_size = parse_request_line(std::string_view(line_).substr(0, length));
        if (!file_size) {
            Log::error("Error handling TCP client {}: invalid file size '{}'", peer_,
                       std::string_view(line_).substr(0, length > 0 ? length - 1 : 0));
            close();
            return;
        }

        requested_ = *file_size;
        Log::info("TCP client {} requested {} bytes", peer_, requested_);
        write_chunk();
    }

    void write_chunk() {
        if (sent_ >= requested_) {
            Log::debug("TCP client {} served {} bytes", peer_, sent_);
            close();
            return;
        }

        std::size_t chunk =
            static_cast<std::size_t>(std::min<uint64_t>(TCP_CHUNK_SIZE, requested_ - sent_));
        payload_.fill(chunk_.data(), chunk);
        arm_deadline(send_timeout_, "stopped reading");
        asio::async_write(socket_, asio::buffer(chunk_.data(), chunk),
                          [self = shared_from_this()](std::error_code error_code,
                                                      std::size_t written) {
                              self->io_deadline_.cancel();
                              if (error_code) {
                                  if (!is_shutdown_error(error_code)) {
                                      Log::error(
                                          "Error handling TCP client {}: {} after {} bytes",
                                          self->peer_, error_code.message(), self->sent_);
                                  }
                                  self->close();
                                  return;
                              }
                              self->sent_ += written;
                              self->write_chunk();
                          });
    }

    // Closing the socket fails the pending read or write, which ends the session
    void arm_deadline(std::chrono::steady_clock::duration timeout, const char* what) {
        io_deadline_.expires_after(timeout);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
        io_deadline_.async_wait([self = shared_from_this(), what, ms](std::error_code error_code) {
            if (error_code) {
                return;
            }
            Log::warn("TCP client {} {} within {} ms, closing", self->peer_, what, ms);
            std::error_code ignored;
            self->socket_.close(ignored);
        });
    }

    void close() {
        std::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_send, ignored);
        socket_.close(ignored);
    }

    tcp::socket                                socket_;
    asio::steady_timer                         io_deadline_;
    std::chrono::steady_clock::duration        read_timeout_;
    std::chrono::steady_clock::duration        send_timeout_;
    std::string                                peer_;
    std::string                                line_;
    std::array<unsigned char, TCP_CHUNK_SIZE>  chunk_{};
    PayloadSource                              payload_;
    uint64_t                                   requested_ = 0;
    uint64_t                                   sent_      = 0;
};
