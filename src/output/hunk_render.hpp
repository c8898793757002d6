#pragma once

/*
    Emit hunk headers and whole hunks as diff text.

    Rendering a parsed, unmodified hunk reproduces its text byte for byte:
    counts and end lines are written only where the original wrote them, and
    the heading is kept verbatim.
*/

#include "patch/document.hpp"
#include "patch/hunk_parser.hpp"

#include <string>
#include <string_view>

namespace patchy {

// "N" or "N,COUNT".
std::string
render_unified_range(const LineRange& range, bool count_given);

// "N" or "N,END".
std::string
render_end_range(const LineRange& range, bool end_given);

// "@@ -a,b +c,d @@heading\n"
std::string
render_unified_header(const HunkHeader& header);

// Banner plus "*** a,b ****\n".
std::string
render_context_header(const HunkHeader& header);

// "--- c,d ----\n"
std::string
render_context_mid_header(const HunkHeader& header);

// "a,bXc,d\n"
std::string
render_normal_header(const HunkHeader& header);

std::string
render_header(const HunkHeader& header);

std::string
render_hunk(std::string_view text, const Hunk& hunk);

}  // namespace patchy
