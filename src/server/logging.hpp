#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

// Leveled stderr logging. Every line is "[speech-server] LEVEL message".
namespace logging {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline void set_level(Level level) {
    threshold().store(level, std::memory_order_relaxed);
}

inline bool enabled(Level level) {
    return level >= threshold().load(std::memory_order_relaxed);
}

inline std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

inline void write(Level level, std::string_view msg) {
    if (!enabled(level)) return;
    std::println(stderr, "[speech-server] {:<5} {}", level_name(level), msg);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
