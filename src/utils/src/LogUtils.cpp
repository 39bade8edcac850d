#include "LogUtils.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <array>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>

namespace LogUtils {

std::shared_ptr<spdlog::logger> logger;

namespace {

struct LoggerSettings {
    Level level = Level::Info;
    size_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    size_t max_files = DEFAULT_MAX_FILES;
};

LoggerSettings settings;

constexpr std::array<std::string_view, 7> LEVEL_TAGS = {
    "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
};

// %X: fixed-width level tag, FATAL instead of spdlog's "critical"
class LevelTagFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        auto index = static_cast<size_t>(msg.level);
        std::string_view tag = index < LEVEL_TAGS.size() ? LEVEL_TAGS[index] : LEVEL_TAGS[2];
        dest.append(tag.data(), tag.data() + tag.size());
    }

    std::unique_ptr<spdlog::custom_flag_formatter> clone() const override {
        return std::make_unique<LevelTagFormatter>();
    }
};

std::shared_ptr<spdlog::logger> make_logger(const std::string& log_file) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, settings.max_file_size, settings.max_files);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto async = std::make_shared<spdlog::async_logger>(
        "telgen", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);

    auto formatter = std::make_unique<spdlog::pattern_formatter>("%Y-%m-%d %H:%M:%S.%f %t %X %v");
    formatter->add_flag<LevelTagFormatter>('X');
    async->set_formatter(std::move(formatter));
    return async;
}

}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Debug: return spdlog::level::debug;
        case Level::Info:  return spdlog::level::info;
        case Level::Warn:  return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Fatal: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void write_fallback(Level level, std::string_view msg) {
    std::string_view tag = LEVEL_TAGS[static_cast<size_t>(to_spdlog_level(level))];
    std::ostream& out = level >= Level::Error ? std::cerr : std::cout;
    out << '[' << tag << "] " << msg << std::endl;
}

void init(Level level, const std::string& log_file, size_t max_file_size, size_t max_files) {
    std::filesystem::path parent_dir = std::filesystem::path(log_file).parent_path();
    if (!parent_dir.empty()) {
        std::filesystem::create_directories(parent_dir);
    }

    settings = LoggerSettings{level, max_file_size, max_files};

    spdlog::init_thread_pool(8192, 1);
    logger = make_logger(log_file);
    logger->set_level(to_spdlog_level(level));
    logger->flush_on(spdlog::level::info);
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

void reopen(const std::string& log_file) {
    LoggerSettings kept = settings;
    shutdown();
    init(kept.level, log_file, kept.max_file_size, kept.max_files);
}

void shutdown() {
    if (logger) logger->flush();
    spdlog::shutdown();
    logger.reset();
}

void set_level(Level level) {
    settings.level = level;
    if (logger) logger->set_level(to_spdlog_level(level));
}

Level get_level() {
    return settings.level;
}

std::string log_file_in(const std::string& log_dir) {
    if (log_dir.empty()) return DEFAULT_LOG_FILE;
    return (std::filesystem::path(log_dir) / "telgen.log").string();
}

}
