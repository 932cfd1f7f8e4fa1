#pragma once
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

struct LogOptions {
    bool                      console   = true;
    std::string               file_path;  // empty: no log file
    spdlog::level::level_enum level     = spdlog::level::info;
};

// Process-wide async logger. Logging before init() is silently dropped, which keeps
// the library headers quiet inside unit tests.
class Logger {
public:
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void init(const LogOptions& options = {});

    template <typename... Args>
    void log(spdlog::level::level_enum lvl, spdlog::format_string_t<Args...> fmt,
             Args&&... args) {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::scoped_lock lock(mutex_);
            logger = logger_;
        }
        if (logger) {
            logger->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    void flush();

private:
    Logger()  = default;
    ~Logger() = default;

    std::mutex                      mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

inline void Logger::init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%T] [%^%l%$] %v");
        sinks.push_back(std::move(console));
    }

    if (!options.file_path.empty()) {
        try {
            std::filesystem::path path(options.file_path);
            if (!path.parent_path().empty()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file_path);
            file->set_pattern("[%Y-%m-%d %T.%e] [%l] [tid %t] %v");
            sinks.push_back(std::move(file));
        } catch (const std::exception& e) {
            fprintf(stderr, "Logger: cannot open %s: %s\n", options.file_path.c_str(), e.what());
        }
    }

    std::scoped_lock lock(mutex_);
    if (sinks.empty()) {
        logger_.reset();
        return;
    }
    if (!spdlog::thread_pool()) {
        spdlog::init_thread_pool(8192, 1);
    }
    logger_ = std::make_shared<spdlog::async_logger>("speedtest", sinks.begin(), sinks.end(),
                                                     spdlog::thread_pool(),
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(options.level);
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);
    spdlog::flush_every(std::chrono::seconds(1));
}

inline void Logger::flush() {
    std::scoped_lock lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
}

// Short forms used throughout the code base
namespace Log {
template <typename... Args>
inline void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    ::Logger::instance().log(spdlog::level::debug, fmt, std::forward<Args>(args)...);
}
}  // namespace Log
