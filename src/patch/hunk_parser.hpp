#pragma once

/*
    Hunk header grammars, hunk boundaries and hunk text extraction for
    unified, context and normal diffs.

        unified   @@ -a(,b) +c(,d) @@ heading
        context   *************** heading
                  *** a(,b) ****
                  ...old block...
                  --- c(,d) ----
                  ...new block...
        normal    a(,b)[acd]c(,d)

    A hunk starts at its (first) header line. Counts of unified hunks default
    to 1 when not written. Context counts are derived from the end line
    numbers; a block without an end line number holds one line, or none when
    the block is omitted and the other block has no context lines.
*/

#include "patch/diff_text.hpp"
#include "util/error.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace patchy {

struct LineRange {
    int64_t start = 0;
    int64_t count = 0;

    // Last line of the range for a non-empty range.
    int64_t
    last() const {
        return start + count - 1;
    }
};

struct HunkHeader {
    HunkStyle style = HunkStyle::Unified;

    LineRange old_range;
    LineRange new_range;

    // Whether the count (unified) or end line (context, normal) was written.
    bool old_count_given = false;
    bool new_count_given = false;

    // Normal diffs: 'a', 'c' or 'd'.
    char normal_op = 0;

    // Text after the closing "@@" (including its leading space), or after
    // the 15 asterisks of a context banner.
    std::string heading;

    // The header line(s): one line for unified and normal hunks, the banner
    // and the old range line for context hunks.
    Span header;

    // Context hunks: the "--- c(,d) ----" line.
    std::optional<Span> mid_header;
};

struct HunkParseOptions {
    // An empty line inside a unified hunk is a context line whose leading
    // space was lost.
    bool valid_unified_empty_line = true;
};

// Whether a hunk header starts at the line containing pos.
bool
is_hunk_header(std::string_view text, Pos pos);

bool
parse_header(std::string_view text,
             Pos hunk_start,
             HunkHeader& header,
             Error& error,
             const HunkParseOptions& options = HunkParseOptions{});

// First position of the hunk body.
Pos
hunk_body_start(const HunkHeader& header);

// End of the hunk with the given header. Trusting the header (unified
// only) consumes the declared counts; otherwise the body is scanned.
Pos
end_of_hunk(std::string_view text, const HunkHeader& header, bool trust_header, const HunkParseOptions& options);

// Span of the hunk enclosing pos, or of the next hunk when pos is outside
// any hunk.
std::optional<Span>
find_hunk_bounds(std::string_view text, Pos pos, const HunkParseOptions& options, bool trust_header = true);

// Start of the next hunk header after the line containing pos.
std::optional<Pos>
next_hunk(std::string_view text, Pos pos);

// Start of the closest hunk header before the line containing pos.
std::optional<Pos>
previous_hunk(std::string_view text, Pos pos);

// A context range line, "*** a(,b) ****" or "--- c(,d) ----" for the given
// lead and tail. `end` is set when the comma form is used. Fails on numbers
// that don't fit in 64 bits.
bool
parse_context_range_line(std::string_view line,
                         std::string_view lead,
                         std::string_view tail,
                         int64_t& start,
                         std::optional<int64_t>& end);

struct HunkText {
    std::string text;

    // Offset in text matching the requested point in the raw hunk.
    std::optional<std::size_t> point;
};

// The literal file text of one side of the hunk in span.
bool
extract_hunk_text(std::string_view text,
                  Span hunk,
                  bool want_new_side,
                  std::optional<Pos> point,
                  const HunkParseOptions& options,
                  HunkText& result,
                  Error& error);

// Asked before repairing damaged hunk lines; gets the question text.
using AutoFixPolicy = std::function<bool(const std::string&)>;

// Verify the declared counts of the hunk at hunk_start against its body,
// repairing whitespace loss and word-wrap damage when the policy accepts.
bool
sanity_check_hunk(std::string& text,
                  Pos hunk_start,
                  const AutoFixPolicy& policy,
                  const HunkParseOptions& options,
                  Error& error);

}  // namespace patchy
