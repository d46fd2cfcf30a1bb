#include "execkit/logger.hpp"

#include <format>
#include <mutex>
#include <print>

namespace execkit {

std::string_view to_string(LogLevel level) {
    switch (level) {
    case LogLevel::debug:
        return "debug";
    case LogLevel::info:
        return "info";
    case LogLevel::warning:
        return "warning";
    case LogLevel::error:
        return "error";
    }
    return "unknown";
}

Result<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug")
        return LogLevel::debug;
    if (name == "info")
        return LogLevel::info;
    if (name == "warning" || name == "warn")
        return LogLevel::warning;
    if (name == "error")
        return LogLevel::error;
    return std::unexpected(std::format("Unknown log level: {}", name));
}

void StreamLogger::write(LogLevel level, std::string_view message) {
    if (!enabled(level))
        return;
    std::lock_guard lock(mtx_);
    std::println(stream_, "[{}] {}", to_string(level), message);
    std::fflush(stream_);
}

} // namespace execkit
