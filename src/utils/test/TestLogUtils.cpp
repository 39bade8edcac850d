#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>

bool log_file_contains(const std::string& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_init_and_info_log() {
    std::string log_file = "testlog/test_info.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Hello Info Log");
    LogUtils::shutdown();
    assert(std::filesystem::exists(log_file));
    assert(log_file_contains(log_file, "Hello Info Log"));
    assert(log_file_contains(log_file, "INFO "));
    std::filesystem::remove_all("testlog");
    std::cout << "test_init_and_info_log passed" << std::endl;
}

void test_debug_level_no_output() {
    std::string log_file = "testlog/test_debug.log";
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::debug("Debug {} should not appear {}", "fmt", 456);
    LogUtils::info("Info {} should appear {}", "fmt", 789);
    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Debug fmt should not appear 456"));
    assert(log_file_contains(log_file, "Info fmt should appear 789"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_debug_level_no_output passed" << std::endl;
}

void test_set_level_runtime() {
    std::string log_file = "testlog/test_set_level.log";
    LogUtils::init(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
    LogUtils::info("Info should not appear");
    LogUtils::warn("Warn should appear");

    LogUtils::set_level(LogUtils::Level::Debug);
    assert(LogUtils::get_level() == LogUtils::Level::Debug);
    LogUtils::debug("Debug should appear now");

    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Info should not appear"));
    assert(log_file_contains(log_file, "Warn should appear"));
    assert(log_file_contains(log_file, "Debug should appear now"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_set_level_runtime passed" << std::endl;
}

void test_reopen_moves_file_sink() {
    std::string first = "testlog/first.log";
    std::string second = LogUtils::log_file_in("testlog/moved");
    assert(second == "testlog/moved/telgen.log");

    LogUtils::init(LogUtils::Level::Info, first, 1024 * 1024, 1);
    LogUtils::info("before reopen");
    LogUtils::reopen(second);
    LogUtils::info("after reopen");
    LogUtils::shutdown();

    assert(log_file_contains(first, "before reopen"));
    assert(!log_file_contains(first, "after reopen"));
    assert(log_file_contains(second, "after reopen"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_reopen_moves_file_sink passed" << std::endl;
}

void test_level_dispatch() {
    assert(LogUtils::log_file_in("") == LogUtils::DEFAULT_LOG_FILE);

    std::string log_file = "testlog/test_dispatch.log";
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::log(LogUtils::Level::Warn, "table {} failed at batch {}", "snmp", 3);
    LogUtils::fatal("schema violation");
    LogUtils::log(LogUtils::Level::Debug, std::string("hidden detail"));
    LogUtils::shutdown();

    assert(log_file_contains(log_file, "WARN  table snmp failed at batch 3"));
    assert(log_file_contains(log_file, "FATAL schema violation"));
    assert(!log_file_contains(log_file, "hidden detail"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_level_dispatch passed" << std::endl;
}

void test_logger_guard_basic() {
    std::string log_file = "testlog/test_logger_guard.log";
    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
        LogUtils::info("LoggerGuard info message");
        guard.set_level(LogUtils::Level::Error);
        LogUtils::warn("LoggerGuard warn message");
    }

    assert(log_file_contains(log_file, "LoggerGuard info message"));
    assert(!log_file_contains(log_file, "LoggerGuard warn message"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_logger_guard_basic passed" << std::endl;
}

void test_fallback_without_logger() {
    // No init: messages go to stdout/stderr and must not crash
    LogUtils::info("fallback info {}", 1);
    LogUtils::error("fallback error");
    std::cout << "test_fallback_without_logger passed" << std::endl;
}

int main() {
    test_fallback_without_logger();
    test_init_and_info_log();
    test_debug_level_no_output();
    test_set_level_runtime();
    test_reopen_moves_file_sink();
    test_level_dispatch();
    test_logger_guard_basic();
    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
