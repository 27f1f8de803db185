#include <fusion/diagnostics/log.h>
#include <fusion/config.h>

#include <atomic>
#include <cstdlib>

namespace fusion {

namespace {

LogLevel initial_level() noexcept {
    if (const char* env = std::getenv("FUSION_LOG")) {
        if (auto level = meow::enum_cast<LogLevel>(env)) return *level;
        std::println(stderr, "[LOG] Warning: unknown FUSION_LOG level '{}', keeping default", env);
    }
    return LogLevel::FUSION_DEFAULT_LOG_LEVEL;
}

std::atomic<LogLevel>& level_slot() noexcept {
    static std::atomic<LogLevel> level{initial_level()};
    return level;
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    level_slot().store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return level_slot().load(std::memory_order_relaxed);
}

} // namespace fusion
