#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/common.h>

#include "client_config.h"
#include "logger.h"
#include "speedtest_server.h"

namespace {

void print_usage(const char* argv0) {
    fprintf(stderr, "usage: %s [--debug] [--log-file <path>] [tcp_port [udp_port]]\n", argv0);
}

std::optional<uint16_t> parse_port(std::string_view text) {
    auto value = parse_count(text);
    if (!value || *value < 0 || *value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        bool                     debug = false;
        std::string              log_file;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            if (arg == "--debug") {
                debug = true;
            } else if (arg == "--log-file" && i + 1 < argc) {
                log_file = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                positional.emplace_back(arg);
            }
        }

        auto& log = Logger::instance();
        LogOptions log_options;
        log_options.file_path = log_file;
        log_options.level     = debug ? spdlog::level::debug : spdlog::level::info;
        log.init(log_options);

        ServerOptions options;
        if (positional.size() > 2) {
            print_usage(argv[0]);
            return 1;
        }
        if (!positional.empty()) {
            auto port = parse_port(positional[0]);
            if (!port) {
                Log::error("Invalid TCP port '{}'", positional[0]);
                return 1;
            }
            options.tcp_port = *port;
        }
        if (positional.size() == 2) {
            auto port = parse_port(positional[1]);
            if (!port) {
                Log::error("Invalid UDP port '{}'", positional[1]);
                return 1;
            }
            options.udp_port = *port;
        }

        asio::io_context io_context;

        SpeedTestServer srv(io_context, options);
        srv.start();

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&io_context, &srv](std::error_code error_code, int) {
            if (error_code) {
                return;
            }
            Log::info("Shutting down server...");
            srv.stop();
            io_context.stop();
        });

        // Sessions run on their own strands, so the context can be shared by a pool
        unsigned                 thread_count = std::max(2U, std::thread::hardware_concurrency());
        std::vector<std::thread> pool;
        for (unsigned i = 1; i < thread_count; ++i) {
            pool.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& thread: pool) {
            thread.join();
        }

        log.flush();
    } catch (std::exception& e) {
        Log::error("Failed to initialize server: {}", e.what());
        Logger::instance().flush();
        return 1;
    }
    return 0;
}
