#pragma once

/*
    Conversions between diff styles, and reversing the direction of a diff.

    Each conversion makes a single pass over the hunks that start in the
    given range and writes a fresh text; the original is not touched. Text
    outside the range, junk lines and file header lines that do not need to
    change are copied byte for byte. For every converted hunk the old and
    new spans are reported so positions can be carried over.
*/

#include "patch/diff_text.hpp"
#include "patch/hunk_parser.hpp"
#include "util/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace patchy {

struct SpanMapping {
    Span from;  // In the input text
    Span to;    // In the converted text
};

struct Conversion {
    std::string text;

    // Converting back gives the input again.
    bool reversible = true;

    int hunks = 0;
    std::vector<SpanMapping> mappings;
};

bool
unified_to_context(std::string_view text,
                   Span range,
                   const HunkParseOptions& options,
                   Conversion& conversion,
                   Error& error);

bool
context_to_unified(std::string_view text,
                   Span range,
                   const HunkParseOptions& options,
                   Conversion& conversion,
                   Error& error);

// context_to_unified, or unified_to_context when to_context is set.
bool
convert(std::string_view text,
        Span range,
        bool to_context,
        const HunkParseOptions& options,
        Conversion& conversion,
        Error& error);

// Swap old and new in every hunk and file header of the range. Handles all
// three styles.
bool
reverse_direction(std::string_view text,
                  Span range,
                  const HunkParseOptions& options,
                  Conversion& conversion,
                  Error& error);

}  // namespace patchy
