#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <asio.hpp>

#include "client_config.h"
#include "logger.h"
#include "transfer_result.h"

// Client side of one TCP transfer: connect, send "<size>\n", count bytes until
// the requested size arrives or the server closes the stream.
class TcpTransfer : public std::enable_shared_from_this<TcpTransfer> {
public:
    using tcp           = asio::ip::tcp;
    using clock         = std::chrono::steady_clock;
    using FinishHandler = std::function<void(TransferResult)>;

    TcpTransfer(asio::any_io_executor executor, tcp::endpoint server, uint64_t file_size,
                int index, FinishHandler on_finish,
                clock::duration connect_timeout = client_config::CONNECT_TIMEOUT,
                clock::duration receive_timeout = client_config::RECEIVE_TIMEOUT)
        : socket_(executor),
          io_deadline_(executor),
          server_(std::move(server)),
          file_size_(file_size),
          connect_timeout_(connect_timeout),
          receive_timeout_(receive_timeout),
          on_finish_cb_(std::move(on_finish)),
          read_buf_(client_config::TCP_READ_BUF_SIZE) {
        result_.kind  = TransferKind::TCP;
        result_.index = index;
    }

    void start() {
        asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() { self->connect(); });
    }

private:
    void connect() {
        Log::debug("TCP transfer #{} connecting to {}:{}", result_.index,
                   server_.address().to_string(), server_.port());

        arm_deadline(connect_timeout_);
        socket_.async_connect(server_, [self = shared_from_this()](std::error_code error_code) {
            self->on_connect(error_code);
        });
    }

    // One deadline guards whichever operation is pending. When it fires the socket is
    // closed, so that operation completes with an error and sees timed_out_.
    void arm_deadline(clock::duration timeout) {
        io_deadline_.expires_after(timeout);
        io_deadline_.async_wait([self = shared_from_this()](std::error_code error_code) {
            if (error_code) {
                return;
            }
            self->timed_out_ = true;
            std::error_code ignored;
            self->socket_.close(ignored);
        });
    }

    void on_connect(std::error_code error_code) {
        io_deadline_.cancel();
        if (timed_out_) {
            fail("Connection timed out");
            return;
        }
        if (error_code == asio::error::connection_refused) {
            fail("Server refused connection");
            return;
        }
        if (error_code) {
            fail(error_code.message());
            return;
        }

        started_at_ = clock::now();
        request_    = std::to_string(file_size_) + "\n";
        asio::async_write(socket_, asio::buffer(request_),
                          [self = shared_from_this()](std::error_code write_error, std::size_t) {
                              if (write_error) {
                                  self->fail("Sending request failed: " + write_error.message());
                                  return;
                              }
                              self->do_read();
                          });
    }

    void do_read() {
        if (result_.bytes_received >= file_size_) {
            finish();
            return;
        }
        uint64_t remaining = file_size_ - result_.bytes_received;
        arm_deadline(receive_timeout_);
        socket_.async_read_some(asio::buffer(read_buf_, static_cast<std::size_t>(std::min<uint64_t>(
                                                            remaining, read_buf_.size()))),
                                [self = shared_from_this()](std::error_code error_code,
                                                            std::size_t bytes) {
                                    self->io_deadline_.cancel();
                                    self->result_.bytes_received += bytes;
                                    if (self->timed_out_) {
                                        self->fail("Receive timed out");
                                        return;
                                    }
                                    if (error_code == asio::error::eof) {
                                        // Early close counts as a (short) completed transfer
                                        self->finish();
                                        return;
                                    }
                                    if (error_code) {
                                        self->fail("Receive failed: " + error_code.message());
                                        return;
                                    }
                                    self->do_read();
                                });
    }

    void finish() {
        std::chrono::duration<double> elapsed = clock::now() - started_at_;
        result_.duration_seconds = elapsed.count();
        result_.throughput_bps   = throughput_bps(result_.bytes_received, result_.duration_seconds);
        if (result_.bytes_received < file_size_) {
            Log::warn("TCP transfer #{}: server closed after {} of {} bytes", result_.index,
                      result_.bytes_received, file_size_);
        }
        close_and_report();
    }

    void fail(std::string reason) {
        Log::warn("TCP transfer #{} to {}:{} failed: {}", result_.index,
                  server_.address().to_string(), server_.port(), reason);
        result_.error = std::move(reason);
        if (started_at_ != clock::time_point{}) {
            std::chrono::duration<double> elapsed = clock::now() - started_at_;
            result_.duration_seconds              = elapsed.count();
        }
        close_and_report();
    }

    void close_and_report() {
        std::error_code ignored;
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        if (on_finish_cb_) {
            on_finish_cb_(result_);
        }
    }

    tcp::socket                socket_;
    asio::steady_timer         io_deadline_;
    tcp::endpoint              server_;
    uint64_t                   file_size_;
    clock::duration            connect_timeout_;
    clock::duration            receive_timeout_;
    FinishHandler              on_finish_cb_;
    std::vector<unsigned char> read_buf_;
    std::string                request_;
    clock::time_point          started_at_{};
    bool                       timed_out_ = false;
    TransferResult             result_;
};
