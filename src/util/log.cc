#include "util/log.hpp"

#include <tuple>

using namespace patchy;

namespace {

// clang-format off
const std::vector<std::tuple<LogLevel, std::string>> kLevelNames = {
    { LogLevel::Quiet,   "quiet"   },
    { LogLevel::Error,   "error"   },
    { LogLevel::Warning, "warning" },
    { LogLevel::Info,    "info"    },
    { LogLevel::Debug,   "debug"   },
};
// clang-format on

}  // namespace

std::optional<LogLevel>
patchy::log_level_from_string(const std::string& s) {
    for (const auto& [level, name] : kLevelNames) {
        if (name == s) {
            return level;
        }
    }
    return std::nullopt;
}

std::string
patchy::repr(LogLevel level) {
    for (const auto& [value, name] : kLevelNames) {
        if (value == level) {
            return name;
        }
    }
    return "unknown";
}

void
Logger::write(LogLevel message_level, fmt::string_view format, fmt::format_args args) {
    if (!enabled(message_level)) {
        return;
    }

    std::string message = fmt::vformat(format, args);
    if (capture != nullptr) {
        capture->push_back(message);
        return;
    }

    fmt::print(stream, "{}: {}\n", repr(message_level), message);
}
