#pragma once
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string_view>
#include <utility>

/// Diagnostics for the fixture. Always written to stderr: stdout carries the
/// protocol stream and must only ever see JSON-RPC responses.

namespace echotest::logger {

enum class level : uint8_t { error, warning, info, debug, trace };

inline std::string_view level_to_string(level lvl) {
    switch (lvl) {
        case level::trace:   return "TRACE";
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARNING";
        case level::error:   return "ERROR";
    }
    return "UNKNOWN";
}

inline std::atomic<level> global_level{level::warning};
inline void set_level(level lvl) { global_level = lvl; }
inline bool enabled(level lvl) { return lvl <= global_level.load(); }

inline std::string_view file_name(std::string_view path) {
    auto pos = path.find_last_of('/');
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

template <typename... Args>
inline void log(level lvl, const char* file, int line,
                fmt::format_string<Args...> fmt_str, Args&&... args) {
    if (!enabled(lvl)) return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    fmt::print(stderr, "{:%Y-%m-%d %H:%M:%S} {}:{} {}: {}\n",
               fmt::localtime(now), file_name(file), line, level_to_string(lvl),
               fmt::format(fmt_str, std::forward<Args>(args)...));
    std::fflush(stderr);
}

} // namespace echotest::logger

#define ECHOTEST_LOG_TRACE(...) \
    ::echotest::logger::log(::echotest::logger::level::trace, __FILE__, __LINE__, __VA_ARGS__)
#define ECHOTEST_LOG_DEBUG(...) \
    ::echotest::logger::log(::echotest::logger::level::debug, __FILE__, __LINE__, __VA_ARGS__)
#define ECHOTEST_LOG_INFO(...) \
    ::echotest::logger::log(::echotest::logger::level::info, __FILE__, __LINE__, __VA_ARGS__)
#define ECHOTEST_LOG_WARN(...) \
    ::echotest::logger::log(::echotest::logger::level::warning, __FILE__, __LINE__, __VA_ARGS__)
#define ECHOTEST_LOG_ERROR(...) \
    ::echotest::logger::log(::echotest::logger::level::error, __FILE__, __LINE__, __VA_ARGS__)
