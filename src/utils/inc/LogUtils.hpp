#pragma once
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/fmt/ostr.h>
#include <memory>
#include <string>
#include <string_view>

namespace LogUtils {

enum class Level {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

inline constexpr const char* DEFAULT_LOG_FILE = "log/telgen.log";
inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 5 * 1024 * 1024;
inline constexpr size_t DEFAULT_MAX_FILES = 3;

// Colored console plus a rotating file, both behind one async logger
void init(Level level = Level::Info,
          const std::string& log_file = DEFAULT_LOG_FILE,
          size_t max_file_size = DEFAULT_MAX_FILE_SIZE,
          size_t max_files = DEFAULT_MAX_FILES);

// Move the file sink to another location, keeping the current level
void reopen(const std::string& log_file);

void shutdown();
void set_level(Level level);
Level get_level();

// "<log_dir>/telgen.log", or the default file for an empty directory
std::string log_file_in(const std::string& log_dir);

extern std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum to_spdlog_level(Level level);

// Used before init() and after shutdown()
void write_fallback(Level level, std::string_view msg);

inline void log(Level level, std::string_view msg) {
    if (logger) {
        logger->log(to_spdlog_level(level), msg);
    } else {
        write_fallback(level, msg);
    }
}

template <typename... Args>
inline void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) {
    if (logger) {
        logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
    } else {
        write_fallback(level, fmt::format(fmt, std::forward<Args>(args)...));
    }
}

inline void debug(const std::string& msg) { log(Level::Debug, msg); }
inline void info(const std::string& msg) { log(Level::Info, msg); }
inline void warn(const std::string& msg) { log(Level::Warn, msg); }
inline void error(const std::string& msg) { log(Level::Error, msg); }
inline void fatal(const std::string& msg) { log(Level::Fatal, msg); }

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void fatal(fmt::format_string<Args...> fmt, Args&&... args) {
    log(Level::Fatal, fmt, std::forward<Args>(args)...);
}

class LoggerGuard {
public:
    explicit LoggerGuard(Level level = Level::Info,
                         const std::string& log_file = DEFAULT_LOG_FILE,
                         size_t max_file_size = DEFAULT_MAX_FILE_SIZE,
                         size_t max_files = DEFAULT_MAX_FILES) {
        LogUtils::init(level, log_file, max_file_size, max_files);
    }

    ~LoggerGuard() {
        LogUtils::shutdown();
    }

    LoggerGuard(const LoggerGuard&) = delete;
    LoggerGuard& operator=(const LoggerGuard&) = delete;

    void set_level(Level level) {
        LogUtils::set_level(level);
    }
};

}
