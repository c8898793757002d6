#include "patch/header_fixup.hpp"

#include "output/hunk_render.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

namespace {

struct LineCounters {
    int64_t space = 0;
    int64_t plus = 0;
    int64_t minus = 0;
    int64_t bang = 0;

    void
    reset() {
        *this = LineCounters{};
    }
};

// "--" optionally followed by whitespace closes a git format-patch mail.
bool
is_signature_separator(std::string_view line) {
    if (!starts_with(line, "--")) {
        return false;
    }
    for (char c : line.substr(2)) {
        if (!(c == ' ' || c == '\t' || c == '\r')) {
            return false;
        }
    }
    return true;
}

bool
context_range_line(std::string_view line, std::string_view lead, std::string_view tail, LineRange& range, bool& end_given) {
    int64_t start = 0;
    std::optional<int64_t> end;
    if (!parse_context_range_line(line, lead, tail, start, end)) {
        return false;
    }
    end_given = end.has_value();
    range = {start, end.value_or(start) - start + 1};
    return true;
}

// New range text for a context block of n lines; the end line is only
// added when the block is not a single line.
std::string
context_range_text(LineRange range, bool end_given, int64_t n) {
    range.count = n;
    return render_end_range(range, end_given || n != 1);
}

void
replace_line(std::string& text, Pos line_start, const std::string& replacement, bool& changed) {
    Pos end = line_end(text, line_start);
    if (std::string_view{text}.substr(line_start, end - line_start) == replacement) {
        return;
    }
    text.replace(line_start, end - line_start, replacement);
    changed = true;
}

}  // namespace

bool
patchy::fixup_hunk_headers(std::string& text, Span range, const HunkParseOptions& options) {
    bool changed = false;

    if (range.end > text.size()) {
        range.end = text.size();
    }

    // Finish counting the hunk the range ends in.
    Pos end = range.end;
    if (auto bounds = find_hunk_bounds(text, end, options, false); bounds && bounds->begin <= end) {
        end = std::max(end, bounds->end);
    }

    LineCounters counters;
    Pos p = end;
    while (p > 0) {
        Pos ls = line_begin(text, p - 1);
        if (ls < range.begin) {
            break;
        }
        p = ls;

        auto line = line_at(text, ls);
        HunkHeader header;
        Error error;
        LineRange context_range;
        bool end_given = false;

        if (starts_with(line, "@@ -") && parse_header(text, ls, header, error, options)) {
            header.old_range.count = counters.space + counters.minus;
            header.new_range.count = counters.space + counters.plus;
            header.old_count_given |= header.old_range.count != 1;
            header.new_count_given |= header.new_range.count != 1;
            auto rendered = render_unified_header(header);
            rendered.pop_back();
            replace_line(text, ls, rendered, changed);
        } else if (context_range_line(line, "--- ", " ----", context_range, end_given)) {
            int64_t n = counters.space + counters.bang + counters.plus;
            if (n > 0) {
                replace_line(text, ls, fmt::format("--- {} ----", context_range_text(context_range, end_given, n)),
                             changed);
            }
        } else if (context_range_line(line, "*** ", " ****", context_range, end_given)) {
            int64_t n = counters.space + counters.bang + counters.minus;
            if (n > 0) {
                replace_line(text, ls, fmt::format("*** {} ****", context_range_text(context_range, end_given, n)),
                             changed);
            }
        } else if (is_unified_file_header(text, ls)) {
            // File header; nothing above it belongs to this hunk.
        } else {
            if (line.empty()) {
                if (options.valid_unified_empty_line) {
                    counters.space++;
                } else {
                    counters.reset();
                }
                continue;
            }
            switch (line[0]) {
                case ' ':
                    counters.space++;
                    break;
                case '+':
                    counters.plus++;
                    break;
                case '-':
                    if (!is_signature_separator(line)) {
                        counters.minus++;
                    }
                    break;
                case '!':
                    counters.bang++;
                    break;
                case '\\':
                case '#':
                    break;
                default:
                    counters.reset();
                    break;
            }
            continue;
        }
        counters.reset();
    }

    return changed;
}
