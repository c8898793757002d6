#pragma once

/*
    Leveled logging to a stdio stream.

    A Logger is owned by whoever drives the engine (the command line tool, a
    test) and handed down explicitly; there is no global logger.
*/

#include <fmt/format.h>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace patchy {

enum class LogLevel {
    Quiet,
    Error,
    Warning,
    Info,
    Debug,
};

std::optional<LogLevel>
log_level_from_string(const std::string& s);

std::string
repr(LogLevel level);

struct Logger {
    LogLevel level = LogLevel::Warning;
    std::FILE* stream = stderr;

    // When set, messages are appended here instead of being written out.
    std::vector<std::string>* capture = nullptr;

    bool
    enabled(LogLevel message_level) const {
        return message_level != LogLevel::Quiet && message_level <= level;
    }

    template <typename... Args>
    void
    error(fmt::string_view format, const Args&... args) {
        write(LogLevel::Error, format, fmt::make_format_args(args...));
    }

    template <typename... Args>
    void
    warning(fmt::string_view format, const Args&... args) {
        write(LogLevel::Warning, format, fmt::make_format_args(args...));
    }

    template <typename... Args>
    void
    info(fmt::string_view format, const Args&... args) {
        write(LogLevel::Info, format, fmt::make_format_args(args...));
    }

    template <typename... Args>
    void
    debug(fmt::string_view format, const Args&... args) {
        write(LogLevel::Debug, format, fmt::make_format_args(args...));
    }

    void
    write(LogLevel message_level, fmt::string_view format, fmt::format_args args);
};

}  // namespace patchy
