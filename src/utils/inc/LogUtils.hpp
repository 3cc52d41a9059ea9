#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <iostream>
#include <string>
#include <memory>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Initialize the log system
void init(Level level = Level::Info,
          const std::string& log_file = "log/pipecheck.log",
          size_t max_file_size = 1024 * 1024 * 5,
          size_t max_files = 3);

void shutdown();
void set_level(Level level);

// Accepts debug/info/warn/warning/error/fatal, case-insensitive
Level parse_level(const std::string& name);

// Logger instance
extern std::shared_ptr<spdlog::logger> logger;

// String version
void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);
void fatal(const std::string& msg);

namespace detail {

// Used before init() or after shutdown()
void fallback(Level level, const std::string& msg);

}

// Variadic template version (fmt-style)
template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->debug(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->info(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->warn(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Warn, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->error(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->critical(fmt, std::forward<Args>(args)...);
    } else {
        detail::fallback(Level::Fatal, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

class LoggerGuard {
public:
    explicit LoggerGuard(Level level = Level::Info,
                         const std::string& log_file = "log/pipecheck.log") {
        LogUtils::init(level, log_file);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;
};

}
