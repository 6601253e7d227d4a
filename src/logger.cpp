// =============================================================================
// logger.cpp - Process-wide leveled logger
// =============================================================================

#include "peg/logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace peg {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_mutex;
std::ofstream g_file;
Logger::Sink g_sink;

std::string now_to_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

const char* base_name(const char* path) {
    const char* name = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') name = p + 1;
    }
    return name;
}

} // namespace

void Logger::set_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel Logger::level() {
    return g_level.load(std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) {
    return level != LogLevel::OFF && level >= Logger::level();
}

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file.is_open()) g_file.close();
    g_file.open(path, std::ios::out | std::ios::app);
    return g_file.is_open();
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    if (!enabled(level)) return;

    std::string formatted = now_to_string() + " [" + level_name(level) + "] " +
                            base_name(file) + ":" + std::to_string(line) + " - " + message;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink) {
        g_sink(level, formatted);
    } else if (g_file.is_open()) {
        g_file << formatted << '\n';
        g_file.flush();
    } else {
        std::cerr << formatted << '\n';
    }
}

LogLevel Logger::parse_level(std::string_view text) {
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warning" || text == "warn") return LogLevel::WARNING;
    if (text == "error") return LogLevel::ERROR;
    if (text == "off") return LogLevel::OFF;
    throw std::invalid_argument("unknown log level: " + std::string(text));
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "UNK";
}

} // namespace peg
