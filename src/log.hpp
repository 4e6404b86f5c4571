#pragma once

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace logger {

enum class Level {
    Debug,
    Info,
    Warn,
    Error
};

void set_min_level(Level level);
Level min_level();
bool enabled(Level level);

// Writes one formatted line to stderr; stdout is left to the caller.
void print(std::string_view domain, std::string_view message, Level level);

struct Logger {
    std::string_view domain{};

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

private:
    template <typename... Args>
    void log(Level level, fmt::format_string<Args...> fmt, Args&&... args) const {
        if (!enabled(level)) return;
        print(domain, fmt::format(fmt, std::forward<Args>(args)...), level);
    }
};

} // namespace logger
