#pragma once

/*
    Find where a hunk applies in a target text.

    The old and new text of the hunk are searched for near the line the
    header names, first literally and then with all whitespace runs treated
    as equal. Finding the new text instead of the old means the hunk is
    already applied (or, when reversing, not applied yet); the result is
    then marked switched.
*/

#include "patch/diff_text.hpp"
#include "patch/hunk_parser.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace patchy {

struct LocateOptions {
    // Undo the hunk: the new text is what should be found.
    bool reverse = false;

    // Take the declared line from the old range instead of the new one.
    bool prefer_old_side = false;

    // Hunk texts longer than this are not searched fuzzily.
    std::size_t fuzzy_max_chars = 8192;
};

struct SourceLocation {
    std::string target;

    // Lines between the declared line and the match.
    int64_t line_offset = 0;

    Span span;

    // The text found is the one the hunk would produce.
    bool switched = false;

    bool fuzzy = false;

    // Text expected at span, and the text replacing it.
    std::string from;
    std::string to;
};

// Start of the 1-based line; lines 0 and 1 are both the first line, lines
// past the end clamp to the end of the text.
Pos
line_position(std::string_view text, int64_t line);

// Closest occurrence of needle starting at a line start, searching forward
// from orig and backward; ties go forward.
std::optional<Span>
find_text(std::string_view haystack, std::string_view needle, Pos orig);

// The whitespace-insensitive pattern for needle; empty when needle has no
// words.
std::string
fuzzy_pattern(std::string_view needle);

std::optional<Span>
find_fuzzy(std::string_view haystack, std::string_view needle, Pos orig, std::size_t max_chars, Logger& logger);

bool
locate(std::string_view diff,
       Span hunk,
       std::string_view target_text,
       const LocateOptions& options,
       const HunkParseOptions& parse_options,
       Logger& logger,
       SourceLocation& location,
       Error& error);

}  // namespace patchy
