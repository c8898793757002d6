#include "patch/diff_text.hpp"

#include <cctype>

using namespace patchy;

namespace {

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

// Consume "N" or "N,N" starting at i; returns the index after it, or npos.
std::size_t
skip_range(std::string_view s, std::size_t i) {
    std::size_t start = i;
    while (i < s.size() && is_digit(s[i])) {
        i++;
    }
    if (i == start) {
        return std::string_view::npos;
    }
    if (i < s.size() && s[i] == ',') {
        std::size_t second = ++i;
        while (i < s.size() && is_digit(s[i])) {
            i++;
        }
        if (i == second) {
            return std::string_view::npos;
        }
    }
    return i;
}

}  // namespace

Pos
patchy::line_begin(std::string_view text, Pos pos) {
    if (pos > text.size()) {
        pos = text.size();
    }
    while (pos > 0 && text[pos - 1] != '\n') {
        pos--;
    }
    return pos;
}

Pos
patchy::line_end(std::string_view text, Pos pos) {
    auto nl = text.find('\n', pos);
    return nl == std::string_view::npos ? text.size() : nl;
}

Pos
patchy::next_line(std::string_view text, Pos pos) {
    auto end = line_end(text, pos);
    return end < text.size() ? end + 1 : text.size();
}

Pos
patchy::previous_line(std::string_view text, Pos pos) {
    auto begin = line_begin(text, pos);
    if (begin == 0) {
        return 0;
    }
    return line_begin(text, begin - 1);
}

std::string_view
patchy::line_at(std::string_view text, Pos pos) {
    auto begin = line_begin(text, pos);
    return text.substr(begin, line_end(text, begin) - begin);
}

std::size_t
patchy::count_lines(std::string_view text) {
    std::size_t lines = 0;
    for (char c : text) {
        lines += c == '\n';
    }
    if (!text.empty() && text.back() != '\n') {
        lines++;
    }
    return lines;
}

bool
patchy::starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string
patchy::repr(HunkStyle style) {
    switch (style) {
        case HunkStyle::Unified:
            return "unified";
        case HunkStyle::Context:
            return "context";
        case HunkStyle::Normal:
            return "normal";
    }
    return "unknown";
}

std::string
patchy::repr(LineKind kind) {
    switch (kind) {
        case LineKind::Context:
            return "Context";
        case LineKind::Added:
            return "Added";
        case LineKind::Removed:
            return "Removed";
        case LineKind::ChangedBang:
            return "ChangedBang";
        case LineKind::NoNewline:
            return "NoNewline";
        case LineKind::Separator:
            return "Separator";
        case LineKind::Other:
            return "Other";
    }
    return "unknown";
}

bool
patchy::is_context_mid_header(std::string_view line) {
    if (!starts_with(line, "--- ")) {
        return false;
    }
    auto i = skip_range(line, 4);
    if (i == std::string_view::npos) {
        return false;
    }
    return line.substr(i) == " ----";
}

LineKind
patchy::classify_line(std::string_view line, HunkStyle style, bool valid_empty_line) {
    if (line.empty()) {
        return valid_empty_line && style != HunkStyle::Normal ? LineKind::Context : LineKind::Other;
    }

    const char c = line[0];
    switch (style) {
        case HunkStyle::Unified: {
            switch (c) {
                case ' ':
                    return LineKind::Context;
                case '+':
                    return LineKind::Added;
                case '-':
                    return LineKind::Removed;
                case '\\':
                    return LineKind::NoNewline;
                default:
                    return LineKind::Other;
            }
        }
        case HunkStyle::Context: {
            switch (c) {
                case ' ':
                    return LineKind::Context;
                case '+':
                    return LineKind::Added;
                case '-':
                    return is_context_mid_header(line) ? LineKind::Separator : LineKind::Removed;
                case '!':
                    return LineKind::ChangedBang;
                case '\\':
                    return LineKind::NoNewline;
                default:
                    return LineKind::Other;
            }
        }
        case HunkStyle::Normal: {
            switch (c) {
                case '<':
                    return LineKind::Removed;
                case '>':
                    return LineKind::Added;
                case '\\':
                    return LineKind::NoNewline;
                case '-':
                    return line == "---" ? LineKind::Separator : LineKind::Other;
                default:
                    return LineKind::Other;
            }
        }
    }
    return LineKind::Other;
}

std::size_t
patchy::prefix_length(HunkStyle style) {
    return style == HunkStyle::Unified ? 1 : 2;
}

bool
patchy::is_file_header_line(std::string_view line) {
    if (starts_with(line, "diff ") || starts_with(line, "Index: ")) {
        return true;
    }
    if (starts_with(line, "--- ") || starts_with(line, "+++ ") || starts_with(line, "*** ")) {
        // Context hunk range lines look alike; they end in "----" or "****".
        auto rest = line.substr(4);
        auto i = skip_range(rest, 0);
        if (i != std::string_view::npos && (rest.substr(i) == " ----" || rest.substr(i) == " ****")) {
            return false;
        }
        return rest.size() > 0;
    }
    return false;
}

bool
patchy::is_unified_file_header(std::string_view text, Pos pos) {
    auto first = line_at(text, pos);
    if (!starts_with(first, "--- ")) {
        return false;
    }
    auto second_pos = next_line(text, pos);
    if (second_pos >= text.size()) {
        return false;
    }
    return starts_with(line_at(text, second_pos), "+++ ");
}

bool
patchy::is_context_file_header(std::string_view text, Pos pos) {
    auto first = line_at(text, pos);
    if (!starts_with(first, "*** ") || !is_file_header_line(first)) {
        return false;
    }
    auto second_pos = next_line(text, pos);
    if (second_pos >= text.size()) {
        return false;
    }
    auto second = line_at(text, second_pos);
    return starts_with(second, "--- ") && is_file_header_line(second);
}
