#pragma once

/*
    Line primitives over a diff text buffer, and the one place where a hunk
    body line is classified.

    Positions are byte offsets into the text. A line runs from its first
    character up to, not including, its newline. Every other module works
    with LineKind values instead of looking at prefix characters itself.
*/

#include <cstddef>
#include <string>
#include <string_view>

namespace patchy {

using Pos = std::size_t;

struct Span {
    Pos begin = 0;
    Pos end = 0;

    std::size_t
    size() const {
        return end - begin;
    }

    bool
    empty() const {
        return begin == end;
    }

    bool
    contains(Pos pos) const {
        return pos >= begin && pos < end;
    }

    bool
    operator==(const Span& other) const {
        return begin == other.begin && end == other.end;
    }

    bool
    operator!=(const Span& other) const {
        return !(*this == other);
    }
};

// Start of the line containing pos.
Pos
line_begin(std::string_view text, Pos pos);

// Position of the newline ending the line containing pos, or the text size.
Pos
line_end(std::string_view text, Pos pos);

// Start of the line after the one containing pos, or the text size.
Pos
next_line(std::string_view text, Pos pos);

// Start of the line before the one containing pos; 0 stays 0.
Pos
previous_line(std::string_view text, Pos pos);

// The line containing pos, without its newline.
std::string_view
line_at(std::string_view text, Pos pos);

// Number of lines; a last line without newline counts.
std::size_t
count_lines(std::string_view text);

bool
starts_with(std::string_view s, std::string_view prefix);

enum class HunkStyle {
    Unified,
    Context,
    Normal,
};

std::string
repr(HunkStyle style);

enum class LineKind {
    Context,
    Added,
    Removed,
    ChangedBang,
    NoNewline,
    Separator,
    Other,
};

std::string
repr(LineKind kind);

// Classify one hunk body line (without its newline) of the given style. An
// empty line is context only when valid_empty_line is set.
LineKind
classify_line(std::string_view line, HunkStyle style, bool valid_empty_line);

// Number of prefix characters in front of the file text of a body line.
std::size_t
prefix_length(HunkStyle style);

// "--- N(,N) ----", the second header of a context hunk.
bool
is_context_mid_header(std::string_view line);

// Lines that end a file section or start a new one: "--- ", "+++ ", "*** "
// followed by a name, "diff ", "Index: ".
bool
is_file_header_line(std::string_view line);

// A unified file header: "--- x" directly followed by "+++ y".
bool
is_unified_file_header(std::string_view text, Pos pos);

// A context file header: "*** x" directly followed by "--- y".
bool
is_context_file_header(std::string_view text, Pos pos);

}  // namespace patchy
