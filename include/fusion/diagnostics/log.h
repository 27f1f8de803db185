#pragma once

#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string_view>
#include <utility>

#include <meow_enum.h>

namespace fusion {

enum class LogLevel : uint8_t { Silent, Error, Warn, Info, Debug };

} // namespace fusion

template <>
struct meow::enum_traits<fusion::LogLevel> {
    static constexpr int min_val = 0;
    static constexpr int max_val = 4;
};

namespace fusion {

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

[[nodiscard]] inline bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::Silent && level <= log_level();
}

// Prints "[TAG] level: message" to stderr when `level` is enabled.
template <typename... Args>
void log(LogLevel level, std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
    if (!log_enabled(level)) return;
    std::println(stderr, "[{}] {}: {}", tag, meow::enum_name(level),
                 std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Warn, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Info, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void log_debug(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
    log(LogLevel::Debug, tag, fmt, std::forward<Args>(args)...);
}

} // namespace fusion
