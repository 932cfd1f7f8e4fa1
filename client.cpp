#include <csignal>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/common.h>

#include "client_config.h"
#include "logger.h"
#include "speedtest_client.h"
#include "transfer_result.h"

namespace {

void print_usage(const char* argv0) {
    fprintf(stderr, "usage: %s [--debug] [--log-file <path>] [file_size tcp_count udp_count]\n",
            argv0);
    fprintf(stderr, "  file_size accepts B, KB, KiB, MB, MiB, GB, GiB suffixes\n");
}

std::optional<ClientConfig> config_from_strings(const std::string& size, const std::string& tcp,
                                                const std::string& udp, std::string& error) {
    ClientConfig config;
    auto         file_size = parse_size_literal(size);
    auto         tcp_count = parse_count(tcp);
    auto         udp_count = parse_count(udp);
    if (!file_size) {
        error = "Invalid file size '" + size + "'";
        return std::nullopt;
    }
    if (!tcp_count || !udp_count) {
        error = "Connection counts must be whole numbers";
        return std::nullopt;
    }
    config.file_size = *file_size;
    config.tcp_count = *tcp_count;
    config.udp_count = *udp_count;
    if (auto reason = config.validate()) {
        error = *reason;
        return std::nullopt;
    }
    return config;
}

bool prompt(const char* question, std::string& answer) {
    std::cout << question << std::flush;
    return static_cast<bool>(std::getline(std::cin, answer));
}

// Asks until the three values form a valid configuration; nullopt on end of input
std::optional<ClientConfig> prompt_config() {
    for (;;) {
        std::string size;
        std::string tcp;
        std::string udp;
        if (!prompt("Enter file size (bytes): ", size) ||
            !prompt("Enter number of TCP connections: ", tcp) ||
            !prompt("Enter number of UDP connections: ", udp)) {
            return std::nullopt;
        }
        std::string error;
        if (auto config = config_from_strings(size, tcp, udp, error)) {
            return config;
        }
        Log::error("Error: {}. Please try again.", error);
        Logger::instance().flush();
    }
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

        std::optional<ClientConfig> config;
        if (positional.size() == 3) {
            std::string error;
            config = config_from_strings(positional[0], positional[1], positional[2], error);
            if (!config) {
                Log::error("Error: {}", error);
                print_usage(argv[0]);
                return 1;
            }
        } else if (positional.empty()) {
            Log::info("=== Speed Test Client ===");
            log.flush();
            config = prompt_config();
            if (!config) {
                return 1;
            }
        } else {
            print_usage(argv[0]);
            return 1;
        }

        Log::info("Running with file size {} bytes, {} TCP and {} UDP connections",
                  config->file_size, config->tcp_count, config->udp_count);

        SpeedTestClient client(*config, [](const TransferResult& result) {
            if (result.ok()) {
                Log::info("{}", format_result(result));
            } else {
                Log::error("{}", format_result(result));
            }
        });

        // The client loop blocks this thread, so signals are watched on a side context
        asio::io_context signal_io;
        asio::signal_set signals(signal_io, SIGINT, SIGTERM);
        signals.async_wait([&client](std::error_code error_code, int) {
            if (error_code) {
                return;
            }
            Log::info("Shutting down client...");
            client.stop();
        });
        std::thread signal_thread([&signal_io]() { signal_io.run(); });
        auto        stop_signal_thread = [&]() {
            signal_io.stop();
            signal_thread.join();
        };

        try {
            client.run();
        } catch (...) {
            stop_signal_thread();
            throw;
        }
        stop_signal_thread();
        log.flush();
    } catch (std::exception& e) {
        Log::error("Failed to initialize client: {}", e.what());
        Logger::instance().flush();
        return 1;
    }
    return 0;
}
