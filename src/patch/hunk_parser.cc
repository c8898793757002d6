#include "patch/hunk_parser.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

using namespace patchy;

namespace internal {

constexpr std::string_view kContextBanner = "***************";

bool
parse_number(std::string_view s, std::size_t& i, int64_t& value) {
    std::size_t start = i;
    value = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
        int digit = s[i] - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
        i++;
    }
    return i > start;
}

// "N" or "N,M"; second is set when the comma form is used.
bool
parse_pair(std::string_view s, std::size_t& i, int64_t& first, std::optional<int64_t>& second) {
    if (!parse_number(s, i, first)) {
        return false;
    }
    second.reset();
    if (i < s.size() && s[i] == ',') {
        i++;
        int64_t value = 0;
        if (!parse_number(s, i, value)) {
            return false;
        }
        second = value;
    }
    return true;
}

bool
expect(std::string_view s, std::size_t& i, std::string_view token) {
    if (s.substr(i, token.size()) != token) {
        return false;
    }
    i += token.size();
    return true;
}

bool
parse_unified_line(std::string_view line, HunkHeader& header) {
    std::size_t i = 0;
    int64_t a = 0, c = 0;
    std::optional<int64_t> b, d;
    if (!expect(line, i, "@@ -") || !parse_pair(line, i, a, b) || !expect(line, i, " +") ||
        !parse_pair(line, i, c, d) || !expect(line, i, " @@")) {
        return false;
    }

    header.style = HunkStyle::Unified;
    header.old_range = {a, b.value_or(1)};
    header.new_range = {c, d.value_or(1)};
    header.old_count_given = b.has_value();
    header.new_count_given = d.has_value();
    header.heading = std::string{line.substr(i)};
    return true;
}

bool
parse_normal_line(std::string_view line, HunkHeader& header) {
    std::size_t i = 0;
    int64_t a = 0, c = 0;
    std::optional<int64_t> b, d;
    if (!parse_pair(line, i, a, b) || i >= line.size()) {
        return false;
    }
    char op = line[i++];
    if (op != 'a' && op != 'c' && op != 'd') {
        return false;
    }
    if (!parse_pair(line, i, c, d) || i != line.size()) {
        return false;
    }

    header.style = HunkStyle::Normal;
    header.normal_op = op;
    header.old_count_given = b.has_value();
    header.new_count_given = d.has_value();
    header.old_range = {a, op == 'a' ? 0 : (b ? *b - a + 1 : 1)};
    header.new_range = {c, op == 'd' ? 0 : (d ? *d - c + 1 : 1)};
    return header.old_range.count >= 0 && header.new_range.count >= 0;
}

bool
is_context_banner(std::string_view line) {
    return starts_with(line, kContextBanner);
}

bool
is_context_body(LineKind kind) {
    return kind == LineKind::Context || kind == LineKind::Added || kind == LineKind::Removed ||
           kind == LineKind::ChangedBang || kind == LineKind::NoNewline;
}

struct BlockInfo {
    Span span;
    bool has_context = false;
};

// Lines of a context block, up to the first line that does not belong.
BlockInfo
scan_context_block(std::string_view text, Pos pos, bool old_block, const HunkParseOptions& options) {
    BlockInfo block;
    block.span = {pos, pos};
    while (pos < text.size()) {
        auto line = line_at(text, pos);
        auto kind = classify_line(line, HunkStyle::Context, options.valid_unified_empty_line);
        if (!is_context_body(kind) || (old_block && kind == LineKind::Added) ||
            (!old_block && kind == LineKind::Removed)) {
            break;
        }
        if (line.empty() && !old_block) {
            // Trailing empty lines after the new block belong to whatever
            // follows unless more body lines come after them.
            Pos probe = pos;
            while (probe < text.size() && line_at(text, probe).empty()) {
                probe = next_line(text, probe);
            }
            if (probe >= text.size() ||
                !is_context_body(classify_line(line_at(text, probe), HunkStyle::Context, false))) {
                break;
            }
        }
        block.has_context |= kind == LineKind::Context;
        pos = next_line(text, pos);
        block.span.end = pos;
    }
    return block;
}

bool
parse_context(std::string_view text, Pos hunk_start, const HunkParseOptions& options, HunkHeader& header, Error& error) {
    auto banner = line_at(text, hunk_start);
    if (!is_context_banner(banner)) {
        return error.set(ErrorKind::MalformedHunk, "Unrecognized context diff first hunk header format");
    }

    Pos range_pos = next_line(text, hunk_start);
    int64_t a = 0, c = 0;
    std::optional<int64_t> b, d;
    if (range_pos >= text.size() || !parse_context_range_line(line_at(text, range_pos), "*** ", " ****", a, b)) {
        return error.set(ErrorKind::MalformedHunk, "Unrecognized context diff first hunk header format");
    }

    header.style = HunkStyle::Context;
    header.heading = std::string{banner.substr(kContextBanner.size())};
    header.header = {hunk_start, next_line(text, range_pos)};

    auto old_block = scan_context_block(text, header.header.end, true, options);
    Pos mid = old_block.span.end;
    if (mid >= text.size() || !parse_context_range_line(line_at(text, mid), "--- ", " ----", c, d)) {
        return error.set(ErrorKind::MalformedHunk, "Unrecognized context diff second hunk header format");
    }
    header.mid_header = Span{mid, next_line(text, mid)};

    auto new_block = scan_context_block(text, header.mid_header->end, false, options);

    auto derive_count = [](int64_t start, const std::optional<int64_t>& end, const BlockInfo& block,
                           const BlockInfo& other) -> int64_t {
        if (end) {
            return *end - start + 1;
        }
        return (block.span.empty() && !other.has_context) ? 0 : 1;
    };

    header.old_range = {a, derive_count(a, b, old_block, new_block)};
    header.new_range = {c, derive_count(c, d, new_block, old_block)};
    header.old_count_given = b.has_value();
    header.new_count_given = d.has_value();

    if (header.old_range.count < 0 || header.new_range.count < 0) {
        return error.set(ErrorKind::MalformedHunk, "Context hunk range ends before it starts");
    }
    return true;
}

bool
is_unified_body(LineKind kind) {
    return kind == LineKind::Context || kind == LineKind::Added || kind == LineKind::Removed ||
           kind == LineKind::NoNewline;
}

bool
is_normal_body(LineKind kind) {
    return kind == LineKind::Added || kind == LineKind::Removed || kind == LineKind::NoNewline ||
           kind == LineKind::Separator;
}

// Count-driven end of a unified hunk; nullopt when the body does not
// satisfy the declared counts.
std::optional<Pos>
trusted_unified_end(std::string_view text, const HunkHeader& header, const HunkParseOptions& options) {
    int64_t old_left = header.old_range.count;
    int64_t new_left = header.new_range.count;
    Pos pos = header.header.end;

    while (old_left > 0 || new_left > 0) {
        if (pos >= text.size()) {
            return std::nullopt;
        }
        switch (classify_line(line_at(text, pos), HunkStyle::Unified, options.valid_unified_empty_line)) {
            case LineKind::Context:
                if (old_left <= 0 || new_left <= 0) {
                    return std::nullopt;
                }
                old_left--;
                new_left--;
                break;
            case LineKind::Removed:
                if (old_left <= 0) {
                    return std::nullopt;
                }
                old_left--;
                break;
            case LineKind::Added:
                if (new_left <= 0) {
                    return std::nullopt;
                }
                new_left--;
                break;
            case LineKind::NoNewline:
                break;
            default:
                return std::nullopt;
        }
        pos = next_line(text, pos);
    }

    if (pos < text.size() &&
        classify_line(line_at(text, pos), HunkStyle::Unified, false) == LineKind::NoNewline) {
        pos = next_line(text, pos);
    }
    return pos;
}

Pos
scanned_end(std::string_view text, const HunkHeader& header, const HunkParseOptions& options) {
    Pos body = header.header.end;
    Pos pos = body;

    while (pos < text.size()) {
        auto line = line_at(text, pos);
        bool in_body = false;
        switch (header.style) {
            case HunkStyle::Unified: {
                if (is_unified_file_header(text, pos)) {
                    break;
                }
                auto kind = classify_line(line, HunkStyle::Unified, options.valid_unified_empty_line);
                in_body = is_unified_body(kind) || starts_with(line, "#");
            } break;
            case HunkStyle::Context: {
                if (is_unified_file_header(text, pos)) {
                    break;
                }
                auto kind = classify_line(line, HunkStyle::Context, options.valid_unified_empty_line);
                in_body = is_context_body(kind) || kind == LineKind::Separator;
            } break;
            case HunkStyle::Normal: {
                in_body = is_normal_body(classify_line(line, HunkStyle::Normal, false));
            } break;
        }
        if (!in_body) {
            break;
        }
        pos = next_line(text, pos);
    }

    // Empty lines at the end are as likely to separate hunks as to be
    // context lines that lost their space.
    while (pos > body) {
        Pos last = line_begin(text, pos - 1);
        if (last < body || !line_at(text, last).empty()) {
            break;
        }
        pos = last;
    }

    // A context hunk always reaches past its mid header.
    if (header.mid_header && pos < header.mid_header->end) {
        pos = header.mid_header->end;
    }
    return pos;
}

void
map_point(std::optional<Pos> point, Pos line_start, Pos content_start, Pos next, const std::string& out,
          HunkText& result) {
    if (!point || *point < line_start || *point >= next) {
        return;
    }
    result.point = *point < content_start ? out.size() : out.size() + (*point - content_start);
}

// Append the kept lines of [begin, end) to result.text.
void
collect_lines(std::string_view text,
              Pos begin,
              Pos end,
              HunkStyle style,
              const HunkParseOptions& options,
              const std::function<bool(LineKind)>& keep,
              std::optional<Pos> point,
              HunkText& result) {
    bool last_kept = false;
    const auto prefix = prefix_length(style);
    Pos pos = begin;
    while (pos < end) {
        auto line = line_at(text, pos);
        Pos next = next_line(text, pos);
        if (next > end) {
            next = end;
        }
        auto kind = classify_line(line, style, options.valid_unified_empty_line);

        if (kind == LineKind::NoNewline) {
            if (last_kept && !result.text.empty() && result.text.back() == '\n') {
                result.text.pop_back();
            }
            last_kept = false;
        } else if (keep(kind)) {
            Pos content_start = pos + std::min(prefix, line.size());
            map_point(point, pos, content_start, next, result.text, result);
            result.text.append(text.substr(content_start, next - content_start));
            last_kept = true;
        } else {
            last_kept = false;
        }
        pos = next;
    }
}

}  // namespace internal

bool
patchy::parse_context_range_line(std::string_view line,
                                 std::string_view lead,
                                 std::string_view tail,
                                 int64_t& start,
                                 std::optional<int64_t>& end) {
    std::size_t i = 0;
    return internal::expect(line, i, lead) && internal::parse_pair(line, i, start, end) && line.substr(i) == tail;
}

bool
patchy::is_hunk_header(std::string_view text, Pos pos) {
    Pos start = line_begin(text, pos);
    if (start >= text.size()) {
        return false;
    }
    auto line = line_at(text, start);
    HunkHeader header;
    if (starts_with(line, "@@ -")) {
        return internal::parse_unified_line(line, header);
    }
    if (internal::is_context_banner(line)) {
        Pos range_pos = next_line(text, start);
        int64_t a = 0;
        std::optional<int64_t> b;
        return range_pos < text.size() &&
               parse_context_range_line(line_at(text, range_pos), "*** ", " ****", a, b);
    }
    return !line.empty() && line[0] >= '0' && line[0] <= '9' && internal::parse_normal_line(line, header);
}

bool
patchy::parse_header(std::string_view text,
                     Pos hunk_start,
                     HunkHeader& header,
                     Error& error,
                     const HunkParseOptions& options) {
    header = HunkHeader{};
    hunk_start = line_begin(text, hunk_start);
    if (hunk_start >= text.size()) {
        return error.set(ErrorKind::MalformedHunk, "No hunk header at end of text");
    }

    auto line = line_at(text, hunk_start);
    if (starts_with(line, "@@")) {
        if (!internal::parse_unified_line(line, header)) {
            return error.set(ErrorKind::MalformedHunk, "Unrecognized unified diff hunk header format");
        }
        header.header = {hunk_start, next_line(text, hunk_start)};
        return true;
    }

    if (starts_with(line, "*")) {
        return internal::parse_context(text, hunk_start, options, header, error);
    }

    if (internal::parse_normal_line(line, header)) {
        header.header = {hunk_start, next_line(text, hunk_start)};
        return true;
    }

    return error.set(ErrorKind::MalformedHunk, fmt::format("Not recognizable hunk header: '{}'", line));
}

Pos
patchy::hunk_body_start(const HunkHeader& header) {
    return header.header.end;
}

Pos
patchy::end_of_hunk(std::string_view text, const HunkHeader& header, bool trust_header, const HunkParseOptions& options) {
    if (trust_header && header.style == HunkStyle::Unified) {
        if (auto end = internal::trusted_unified_end(text, header, options); end) {
            return *end;
        }
    }
    return internal::scanned_end(text, header, options);
}

std::optional<Span>
patchy::find_hunk_bounds(std::string_view text, Pos pos, const HunkParseOptions& options, bool trust_header) {
    if (pos > text.size()) {
        pos = text.size();
    }

    auto bounds_at = [&](Pos start) -> std::optional<Span> {
        HunkHeader header;
        Error error;
        if (!parse_header(text, start, header, error, options)) {
            return std::nullopt;
        }
        return Span{start, end_of_hunk(text, header, trust_header, options)};
    };

    // Walk back to the closest header and see whether pos is inside its hunk.
    Pos start = line_begin(text, pos);
    std::optional<Pos> header_pos;
    if (start < text.size() && is_hunk_header(text, start)) {
        header_pos = start;
    } else {
        header_pos = previous_hunk(text, pos);
    }

    if (header_pos) {
        auto bounds = bounds_at(*header_pos);
        if (bounds && pos < bounds->end) {
            return bounds;
        }
    }

    if (auto next = next_hunk(text, pos); next) {
        return bounds_at(*next);
    }
    return std::nullopt;
}

std::optional<Pos>
patchy::next_hunk(std::string_view text, Pos pos) {
    Pos p = next_line(text, pos);
    while (p < text.size()) {
        if (is_hunk_header(text, p)) {
            return p;
        }
        p = next_line(text, p);
    }
    return std::nullopt;
}

std::optional<Pos>
patchy::previous_hunk(std::string_view text, Pos pos) {
    Pos p = line_begin(text, pos);
    while (p > 0) {
        p = previous_line(text, p);
        if (is_hunk_header(text, p)) {
            return p;
        }
    }
    return std::nullopt;
}

bool
patchy::extract_hunk_text(std::string_view text,
                          Span hunk,
                          bool want_new_side,
                          std::optional<Pos> point,
                          const HunkParseOptions& options,
                          HunkText& result,
                          Error& error) {
    result = HunkText{};

    HunkHeader header;
    if (!parse_header(text, hunk.begin, header, error, options)) {
        return false;
    }

    Pos body = hunk_body_start(header);
    switch (header.style) {
        case HunkStyle::Unified: {
            internal::collect_lines(
                text, body, hunk.end, HunkStyle::Unified, options,
                [&](LineKind kind) {
                    return kind == LineKind::Context || (kind == LineKind::Removed && !want_new_side) ||
                           (kind == LineKind::Added && want_new_side);
                },
                point, result);
        } break;
        case HunkStyle::Context: {
            Span old_block{body, header.mid_header->begin};
            Span new_block{header.mid_header->end, std::max(hunk.end, header.mid_header->end)};
            Span wanted = want_new_side ? new_block : old_block;
            Span other = want_new_side ? old_block : new_block;
            if (wanted.empty()) {
                // An omitted block holds only the context lines of the other.
                internal::collect_lines(
                    text, other.begin, other.end, HunkStyle::Context, options,
                    [](LineKind kind) { return kind == LineKind::Context; }, point, result);
            } else {
                internal::collect_lines(
                    text, wanted.begin, wanted.end, HunkStyle::Context, options,
                    [&](LineKind kind) {
                        return kind == LineKind::Context || kind == LineKind::ChangedBang ||
                               (kind == (want_new_side ? LineKind::Added : LineKind::Removed));
                    },
                    point, result);
            }
        } break;
        case HunkStyle::Normal: {
            internal::collect_lines(
                text, body, hunk.end, HunkStyle::Normal, options,
                [&](LineKind kind) { return kind == (want_new_side ? LineKind::Added : LineKind::Removed); },
                point, result);
        } break;
    }

    if (point && *point == hunk.end) {
        result.point = result.text.size();
    }
    return true;
}

namespace internal {

std::string
messed_up_message(int64_t before, int64_t after) {
    return (before == 0 || after == 0) ? "End of hunk ambiguously marked" : "Hunk seriously messed up";
}

bool
ask(const AutoFixPolicy& policy, const std::string& question) {
    return policy && policy(question);
}

// Join the line at pos onto the previous one with a space. Returns the
// start of the line after the joined one.
Pos
join_wrapped_line(std::string& text, Pos pos) {
    text.insert(pos, " ");
    text.erase(pos - 1, 1);
    return next_line(text, pos - 1);
}

bool
sanity_check_unified(std::string& text,
                     const HunkHeader& header,
                     const AutoFixPolicy& policy,
                     const HunkParseOptions& options,
                     Error& error) {
    int64_t before = header.old_range.count;
    int64_t after = header.new_range.count;
    const Pos body = header.header.end;
    Pos pos = body;

    while (true) {
        if (pos >= text.size()) {
            if (before == 0 && after == 0) {
                return true;
            }
            return error.set(ErrorKind::MalformedHunk, messed_up_message(before, after));
        }

        auto line = line_at(text, pos);
        switch (text[pos]) {
            case ' ':
                before--;
                after--;
                break;
            case '-': {
                // "--" or "-- " ends a git format-patch mail body.
                auto dashes = std::min(line.find_first_not_of('-'), line.size());
                bool separator = dashes >= 2 && (dashes == line.size() ||
                                                 (dashes + 1 == line.size() && line.back() == ' '));
                if (separator && before == 0 && after == 0) {
                    return true;
                }
                if (is_unified_file_header(text, pos) && before == 0 && after == 0) {
                    // Two concatenated patches: only the counts tell where
                    // the first ends, so make it visible.
                    text.insert(pos, "\n");
                    return true;
                }
                before--;
            } break;
            case '+':
                after--;
                break;
            case '\\':
                break;
            default: {
                const bool empty_line = text[pos] == '\n';
                if (options.valid_unified_empty_line && empty_line && before > 0 && after > 0) {
                    before--;
                    after--;
                    break;
                }
                if (before == 0 && after == 0) {
                    return true;
                }
                if (before < 0 || after < 0) {
                    return error.set(ErrorKind::MalformedHunk, messed_up_message(before, after));
                }
                std::string what = empty_line ? "whitespace loss" : "word-wrap damage";
                if (!ask(policy, fmt::format("Try to auto-fix {}? ", what))) {
                    return error.set(ErrorKind::MalformedHunk, "Abort!");
                }
                if (empty_line) {
                    text.insert(pos, " ");
                    continue;
                }
                if (pos == body) {
                    return error.set(ErrorKind::MalformedHunk, "Hunk seriously messed up");
                }
                pos = join_wrapped_line(text, pos);
                continue;
            }
        }
        pos = next_line(text, pos);
    }
}

bool
sanity_check_context_half(std::string& text, Pos& pos, int64_t lines, const AutoFixPolicy& policy, Error& error) {
    auto is_one_of = [](char c, std::string_view set) { return c != 0 && set.find(c) != std::string_view::npos; };

    const Pos half_start = pos;
    int64_t count = lines;
    while (true) {
        char c = pos < text.size() ? text[pos] : 0;
        char c2 = pos + 1 < text.size() ? text[pos + 1] : 0;

        if (is_one_of(c, " !+-") && is_one_of(c2, " \t")) {
            count--;
        } else if (count == 0 || count == lines) {
            return true;
        } else if (is_one_of(c, "!+-")) {
            if (c2 == '\n' && ask(policy, "Try to auto-fix whitespace loss damage? ")) {
                text.insert(pos + 1, " ");
                continue;
            }
            return error.set(ErrorKind::MalformedHunk, "End of hunk ambiguously marked");
        } else if (count < 0 || c == 0) {
            return error.set(ErrorKind::MalformedHunk, "End of hunk ambiguously marked");
        } else if (!ask(policy, "Try to auto-fix whitespace loss and word-wrap damage? ")) {
            return error.set(ErrorKind::MalformedHunk, "Abort!");
        } else if (c == '\n') {
            text.insert(pos, "  ");
            continue;
        } else {
            if (pos == half_start) {
                return error.set(ErrorKind::MalformedHunk, "Hunk seriously messed up");
            }
            pos = join_wrapped_line(text, pos);
            continue;
        }
        pos = next_line(text, pos);
    }
}

bool
sanity_check_context(std::string& text, Pos hunk_start, const AutoFixPolicy& policy, Error& error) {
    Pos range_pos = next_line(text, hunk_start);
    int64_t a = 0, c = 0;
    std::optional<int64_t> b, d;
    if (!is_context_banner(line_at(text, hunk_start)) || range_pos >= text.size() ||
        !parse_context_range_line(line_at(text, range_pos), "*** ", " ****", a, b)) {
        return error.set(ErrorKind::MalformedHunk, "Unrecognized context diff first hunk header format");
    }

    Pos pos = next_line(text, range_pos);
    if (!sanity_check_context_half(text, pos, b ? *b - a + 1 : 1, policy, error)) {
        return false;
    }

    if (pos >= text.size() || !parse_context_range_line(line_at(text, pos), "--- ", " ----", c, d)) {
        return error.set(ErrorKind::MalformedHunk, "Unrecognized context diff second hunk header format");
    }
    pos = next_line(text, pos);
    return sanity_check_context_half(text, pos, d ? *d - c + 1 : 1, policy, error);
}

}  // namespace internal

bool
patchy::sanity_check_hunk(std::string& text,
                          Pos hunk_start,
                          const AutoFixPolicy& policy,
                          const HunkParseOptions& options,
                          Error& error) {
    hunk_start = line_begin(text, hunk_start);
    auto line = line_at(text, hunk_start);

    if (starts_with(line, "*")) {
        return internal::sanity_check_context(text, hunk_start, policy, error);
    }

    HunkHeader header;
    if (!parse_header(text, hunk_start, header, error, options)) {
        error.message = "Not recognizable hunk header";
        return false;
    }

    if (header.style == HunkStyle::Unified) {
        return internal::sanity_check_unified(text, header, policy, options, error);
    }

    // Normal hunks carry no counts to check against.
    return true;
}
