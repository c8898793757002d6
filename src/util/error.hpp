#pragma once

/*
    Error values shared by the diff engine.

    Parsing and locating routinely fail for a single hunk while the caller
    keeps going with the next one, so failures travel as values. Functions
    that can fail return `bool` and fill in an `Error`.
*/

#include <string>
#include <utility>

namespace patchy {

// clang-format off
enum class ErrorKind {
    None,
    MalformedHunk,    // No header grammar matches, or the counts can't be reconciled with the body
    NotFound,         // Hunk text not found in the target, not even fuzzily
    IO,               // Target unreadable or unwritable
    AmbiguousFormat,  // Partial grammar match; reported like a malformed hunk
};
// clang-format on

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool
    is_ok() const {
        return kind == ErrorKind::None;
    }

    // Always returns false so failing functions can `return error.set(...)`.
    bool
    set(ErrorKind error_kind, std::string error_message) {
        kind = error_kind;
        message = std::move(error_message);
        return false;
    }

    void
    clear() {
        kind = ErrorKind::None;
        message.clear();
    }
};

std::string
repr(ErrorKind kind);

}  // namespace patchy
