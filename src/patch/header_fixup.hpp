#pragma once

/*
    Recompute hunk header counts from the hunk bodies.

    The scan runs backward from the end of the hunk containing the end of the
    range, counting body lines since the last header seen. Reaching a unified
    header rewrites both counts; reaching a context range line rewrites its
    end line. Running it twice changes nothing the second time.
*/

#include "patch/diff_text.hpp"
#include "patch/hunk_parser.hpp"

#include <string>

namespace patchy {

// Returns true when any header changed.
bool
fixup_hunk_headers(std::string& text, Span range, const HunkParseOptions& options);

}  // namespace patchy
