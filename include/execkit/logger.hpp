#pragma once

#include "execkit/utility.hpp"

#include <cstdio>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace execkit {

enum class LogLevel {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3,
};

std::string_view to_string(LogLevel level);

/**
 * @brief Parses `debug`, `info`, `warning` (or `warn`) and `error`.
 */
Result<LogLevel> parse_log_level(std::string_view name);

/**
 * @brief Abstract leveled log sink.
 *
 * Implementations provide `write`; formatting happens here and only when the
 * level is enabled.
 */
class Logger {
public:
    virtual ~Logger() = default;

    virtual bool enabled(LogLevel) const {
        return true;
    }

    virtual void write(LogLevel level, std::string_view message) = 0;

    template <typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args &&...args) {
        if (!enabled(level))
            return;
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::error, fmt, std::forward<Args>(args)...);
    }
};

/**
 * @brief Writes `[level] message` lines to a C stream, dropping anything
 * below the minimum level. Safe to share between threads.
 */
class StreamLogger final : public Logger {
public:
    explicit StreamLogger(LogLevel minimum_level = LogLevel::warning, std::FILE *stream = stderr)
        : minimum_level_(minimum_level), stream_(stream) {
    }

    bool enabled(LogLevel level) const override {
        return level >= minimum_level_;
    }

    void write(LogLevel level, std::string_view message) override;

    LogLevel minimum_level() const {
        return minimum_level_;
    }

private:
    LogLevel minimum_level_;
    std::FILE *stream_;
    std::mutex mtx_;
};

class NullLogger final : public Logger {
public:
    bool enabled(LogLevel) const override {
        return false;
    }

    void write(LogLevel, std::string_view) override {
    }
};

} // namespace execkit
