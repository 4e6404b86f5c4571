#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

#include <fmt/chrono.h>

namespace logger {

namespace {

std::atomic<Level> g_min_level{Level::Info};

char level_char(Level level) {
    switch (level) {
        case Level::Debug: return 'D';
        case Level::Info: return 'I';
        case Level::Warn: return 'W';
        case Level::Error: return 'E';
    }
    return '?';
}

} // namespace

void set_min_level(Level level) {
    g_min_level.store(level, std::memory_order_relaxed);
}

Level min_level() {
    return g_min_level.load(std::memory_order_relaxed);
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(min_level());
}

void print(std::string_view domain, std::string_view message, Level level) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    fmt::print(stderr, "[{}] [{}] {} [{:%T}]\n", level_char(level), domain, message, fmt::localtime(now));
}

} // namespace logger
