#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <exception>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "client_config.h"
#include "logger.h"
#include "offer_listener.h"
#include "tcp_transfer.h"
#include "transfer_result.h"
#include "udp_transfer.h"

struct OrchestratorTimeouts {
    std::chrono::steady_clock::duration connect_timeout = client_config::CONNECT_TIMEOUT;
    std::chrono::steady_clock::duration receive_timeout = client_config::RECEIVE_TIMEOUT;
    std::chrono::steady_clock::duration udp_inactivity  = client_config::UDP_INACTIVITY_TIMEOUT;
};

// Runs one round of transfers against a discovered server. Every transfer owns its
// socket and strand; run() returns once all of them have finished, whatever the outcome.
class TransferOrchestrator {
public:
    using ResultHandler = std::function<void(const TransferResult&)>;

    explicit TransferOrchestrator(OrchestratorTimeouts timeouts = {},
                                  unsigned max_threads = std::thread::hardware_concurrency())
        : timeouts_(timeouts), max_threads_(std::max(1U, max_threads)) {}

    std::vector<TransferResult> run(const DiscoveredServer& server, const ClientConfig& config,
                                    const ResultHandler& on_result = nullptr) {
        asio::io_context io_context;

        std::mutex                  results_mutex;
        std::vector<TransferResult> results;
        results.reserve(static_cast<std::size_t>(std::max(0, config.tcp_count)) +
                        static_cast<std::size_t>(std::max(0, config.udp_count)));

        in_flight_ = 0;
        peak_      = 0;

        auto on_finish = [this, &results_mutex, &results, &on_result](TransferResult result) {
            in_flight_.fetch_sub(1);
            if (on_result) {
                on_result(result);
            }
            std::lock_guard<std::mutex> lock(results_mutex);
            results.push_back(std::move(result));
        };

        asio::ip::tcp::endpoint tcp_server(server.address, server.tcp_port);
        asio::ip::udp::endpoint udp_server(server.address, server.udp_port);

        for (int i = 1; i <= config.tcp_count; ++i) {
            auto strand = asio::make_strand(io_context);
            launch(strand, std::make_shared<TcpTransfer>(strand, tcp_server, config.file_size, i,
                                                         on_finish, timeouts_.connect_timeout,
                                                         timeouts_.receive_timeout));
        }
        for (int i = 1; i <= config.udp_count; ++i) {
            auto strand = asio::make_strand(io_context);
            launch(strand, std::make_shared<UdpTransfer>(strand, udp_server, config.file_size, i,
                                                         on_finish, timeouts_.udp_inactivity));
        }

        Log::debug("Started {} TCP and {} UDP transfers to {}", config.tcp_count,
                   config.udp_count, server.address.to_string());

        // run() returns on every thread once no transfer has pending work left
        unsigned total   = static_cast<unsigned>(std::max(0, config.tcp_count) +
                                                 std::max(0, config.udp_count));
        unsigned threads = std::clamp(total, 1U, max_threads_);

        std::vector<std::thread> pool;
        pool.reserve(threads - 1);
        for (unsigned i = 1; i < threads; ++i) {
            pool.emplace_back([&io_context]() { run_until_idle(io_context); });
        }
        run_until_idle(io_context);
        for (auto& thread: pool) {
            thread.join();
        }

        return results;
    }

    // Highest number of transfers in flight at once during the last run()
    std::size_t peak_in_flight() const {
        return peak_.load();
    }

private:
    // A throwing handler must not strand the remaining transfers
    static void run_until_idle(asio::io_context& io_context) {
        for (;;) {
            try {
                io_context.run();
                return;
            } catch (const std::exception& e) {
                Log::error("Transfer handler threw: {}", e.what());
            }
        }
    }

    // A transfer counts as in flight from the moment its first handler runs on a pool
    // thread until its result is reported
    template <typename Transfer>
    void launch(const asio::strand<asio::io_context::executor_type>& strand,
                std::shared_ptr<Transfer> transfer) {
        asio::post(strand, [this, transfer]() {
            track_start();
            transfer->start();
        });
    }

    void track_start() {
        std::size_t now  = in_flight_.fetch_add(1) + 1;
        std::size_t peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
    }

    OrchestratorTimeouts     timeouts_;
    unsigned                 max_threads_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> peak_{0};
};
