#include "format_converter.hpp"

#include "output/hunk_render.hpp"
#include "patch/document.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <utility>

using namespace patchy;

namespace {

// Returns false when the hunk is not of a style the conversion handles;
// it is then copied unchanged.
using HunkWriter = std::function<bool(std::string_view text, const Hunk& hunk, std::string& out, Conversion& conversion)>;

// Writes the converted file header at pos and returns the position after
// it, or pos when there is none.
using FileHeaderWriter = std::function<Pos(std::string_view text, Pos pos, std::string& out)>;

std::string_view
body_text(std::string_view text, const HunkLine& line, HunkStyle style) {
    auto raw = text.substr(line.span.begin, line.span.size());
    return raw.substr(std::min(prefix_length(style), raw.size()));
}

std::string_view
raw_text(std::string_view text, const HunkLine& line) {
    return text.substr(line.span.begin, line.span.size());
}

void
append_line(std::string& out, std::string_view prefix, std::string_view rest) {
    out.append(prefix);
    out.append(rest);
    out += '\n';
}

// Rewrite the prefix of the two file header lines at pos.
Pos
write_file_header(std::string_view text,
                  Pos pos,
                  std::string_view first_prefix,
                  std::string_view second_prefix,
                  bool swap_names,
                  std::string& out) {
    Pos second = next_line(text, pos);
    Pos after = next_line(text, second);
    auto first_name = line_at(text, pos).substr(4);
    auto second_name = line_at(text, second).substr(4);
    if (swap_names) {
        std::swap(first_name, second_name);
    }
    append_line(out, first_prefix, first_name);
    out.append(second_prefix);
    out.append(second_name);
    if (line_end(text, second) < text.size()) {
        out += '\n';
    }
    return after;
}

bool
convert_range(std::string_view text,
              Span range,
              const HunkParseOptions& options,
              const FileHeaderWriter& write_header,
              const HunkWriter& write_hunk,
              Conversion& conversion,
              Error& error) {
    conversion = Conversion{};
    range.end = std::min(range.end, text.size());
    if (range.begin > range.end) {
        return error.set(ErrorKind::MalformedHunk, "Invalid range");
    }

    std::string& out = conversion.text;
    out.reserve(text.size() + text.size() / 4);

    Pos pos = line_begin(text, range.begin);
    out.append(text.substr(0, pos));

    while (pos < range.end) {
        if (is_hunk_header(text, pos)) {
            Hunk hunk;
            if (!parse_hunk(text, pos, options, hunk, error)) {
                return false;
            }
            Pos out_begin = out.size();
            if (write_hunk(text, hunk, out, conversion)) {
                if (!hunk.body.empty() && !hunk.body.back().has_newline && !out.empty() && out.back() == '\n') {
                    out.pop_back();
                }
                conversion.hunks++;
                conversion.mappings.push_back({hunk.span, {out_begin, out.size()}});
            } else {
                out.append(text.substr(hunk.span.begin, hunk.span.size()));
            }
            pos = std::max(hunk.span.end, next_line(text, pos));
            continue;
        }

        Pos after = write_header(text, pos, out);
        if (after != pos) {
            pos = after;
            continue;
        }

        Pos next = next_line(text, pos);
        out.append(text.substr(pos, next - pos));
        pos = next;
    }

    out.append(text.substr(pos));
    return true;
}

enum class BlockSide {
    None,
    Old,
    New,
    Both,
};

bool
write_unified_as_context(std::string_view text, const Hunk& hunk, std::string& out, Conversion& conversion) {
    const auto& header = hunk.header;
    if (header.style != HunkStyle::Unified) {
        return false;
    }
    if (!header.old_count_given || !header.new_count_given) {
        conversion.reversible = false;
    }

    std::string old_block;
    std::string new_block;
    bool old_changes = false;
    bool new_changes = false;
    BlockSide last = BlockSide::None;

    const auto& body = hunk.body;
    auto run_end = [&](std::size_t i, LineKind kind) {
        while (i < body.size() && (body[i].kind == kind || body[i].kind == LineKind::NoNewline)) {
            i++;
        }
        return i;
    };
    auto append_run = [&](std::string& block, std::size_t begin, std::size_t end, std::string_view prefix) {
        for (std::size_t i = begin; i < end; i++) {
            if (body[i].kind == LineKind::NoNewline) {
                conversion.reversible = false;
                append_line(block, "", raw_text(text, body[i]));
            } else {
                append_line(block, prefix, body_text(text, body[i], HunkStyle::Unified));
            }
        }
    };

    std::size_t i = 0;
    while (i < body.size()) {
        const auto& line = body[i];
        switch (line.kind) {
            case LineKind::Context: {
                if (line.span.empty()) {
                    conversion.reversible = false;
                }
                auto content = body_text(text, line, HunkStyle::Unified);
                append_line(old_block, "  ", content);
                append_line(new_block, "  ", content);
                last = BlockSide::Both;
                i++;
            } break;
            case LineKind::Removed: {
                std::size_t removed_end = run_end(i, LineKind::Removed);
                bool paired = removed_end < body.size() && body[removed_end].kind == LineKind::Added;
                append_run(old_block, i, removed_end, paired ? "! " : "- ");
                old_changes = true;
                last = BlockSide::Old;
                i = removed_end;
                if (paired) {
                    std::size_t added_end = run_end(i, LineKind::Added);
                    if (added_end < body.size() && body[added_end].kind == LineKind::Removed) {
                        conversion.reversible = false;
                    }
                    append_run(new_block, i, added_end, "! ");
                    new_changes = true;
                    last = BlockSide::New;
                    i = added_end;
                }
            } break;
            case LineKind::Added: {
                std::size_t added_end = run_end(i, LineKind::Added);
                if (added_end < body.size() && body[added_end].kind == LineKind::Removed) {
                    conversion.reversible = false;
                }
                append_run(new_block, i, added_end, "+ ");
                new_changes = true;
                last = BlockSide::New;
                i = added_end;
            } break;
            case LineKind::NoNewline:
                conversion.reversible = false;
                if (last == BlockSide::Old || last == BlockSide::Both) {
                    append_line(old_block, "", raw_text(text, line));
                }
                if (last == BlockSide::New || last == BlockSide::Both) {
                    append_line(new_block, "", raw_text(text, line));
                }
                i++;
                break;
            default:
                conversion.reversible = false;
                append_line(old_block, "", raw_text(text, line));
                i++;
                break;
        }
    }

    auto range_text = [](const LineRange& range) { return render_end_range(range, range.count != 0); };

    out += fmt::format("***************{}\n", header.heading);
    out += fmt::format("*** {} ****\n", range_text(header.old_range));
    if (old_changes) {
        out += old_block;
    }
    out += fmt::format("--- {} ----\n", range_text(header.new_range));
    if (new_changes) {
        out += new_block;
    }
    return true;
}

struct BlockLine {
    LineKind kind;
    std::string_view content;
    std::string_view raw;
};

bool
write_context_as_unified(std::string_view text, const Hunk& hunk, std::string& out, Conversion& conversion) {
    const auto& header = hunk.header;
    if (header.style != HunkStyle::Context) {
        return false;
    }

    std::vector<BlockLine> old_lines;
    std::vector<BlockLine> new_lines;
    bool in_new_block = false;
    for (const auto& line : hunk.body) {
        if (line.kind == LineKind::Separator) {
            in_new_block = true;
            continue;
        }
        BlockLine block_line{line.kind, body_text(text, line, HunkStyle::Context), raw_text(text, line)};
        (in_new_block ? new_lines : old_lines).push_back(block_line);
    }

    // An omitted block has the context lines of the other one.
    auto context_of = [](const std::vector<BlockLine>& lines) {
        std::vector<BlockLine> context;
        for (const auto& line : lines) {
            if (line.kind == LineKind::Context) {
                context.push_back(line);
            }
        }
        return context;
    };
    if (old_lines.empty()) {
        old_lines = context_of(new_lines);
    } else if (new_lines.empty()) {
        new_lines = context_of(old_lines);
    }

    std::string body;
    int64_t old_count = 0;
    int64_t new_count = 0;

    auto take_changes = [&](const std::vector<BlockLine>& lines, std::size_t& i, char prefix, int64_t& count) {
        while (i < lines.size() && lines[i].kind != LineKind::Context) {
            const auto& line = lines[i++];
            if (line.kind == LineKind::NoNewline || line.kind == LineKind::Other) {
                append_line(body, "", line.raw);
                continue;
            }
            body += prefix;
            append_line(body, "", line.content);
            count++;
        }
    };
    auto take_marker = [&](const std::vector<BlockLine>& lines, std::size_t& i) {
        if (i < lines.size() && lines[i].kind == LineKind::NoNewline) {
            append_line(body, "", lines[i].raw);
            i++;
            return true;
        }
        return false;
    };

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < old_lines.size() || j < new_lines.size()) {
        take_changes(old_lines, i, '-', old_count);
        take_changes(new_lines, j, '+', new_count);

        if (i < old_lines.size() && j < new_lines.size()) {
            append_line(body, " ", old_lines[i].content);
            old_count++;
            new_count++;
            i++;
            j++;
            if (take_marker(old_lines, i)) {
                if (j < new_lines.size() && new_lines[j].kind == LineKind::NoNewline) {
                    j++;
                }
            } else {
                take_marker(new_lines, j);
            }
        } else if (i < old_lines.size()) {
            // The blocks disagree on their context lines.
            conversion.reversible = false;
            append_line(body, "-", old_lines[i++].content);
            old_count++;
        } else if (j < new_lines.size()) {
            conversion.reversible = false;
            append_line(body, "+", new_lines[j++].content);
            new_count++;
        }
    }

    HunkHeader unified;
    unified.style = HunkStyle::Unified;
    unified.old_range = {header.old_range.start, old_count};
    unified.new_range = {header.new_range.start, new_count};
    unified.old_count_given = true;
    unified.new_count_given = true;
    unified.heading = header.heading;

    out += render_unified_header(unified);
    out += body;
    return true;
}

HunkHeader
swapped_header(const HunkHeader& header) {
    HunkHeader swapped = header;
    std::swap(swapped.old_range, swapped.new_range);
    std::swap(swapped.old_count_given, swapped.new_count_given);
    if (header.normal_op == 'a') {
        swapped.normal_op = 'd';
    } else if (header.normal_op == 'd') {
        swapped.normal_op = 'a';
    }
    return swapped;
}

// The raw line with its prefix replaced.
void
append_flipped(std::string& out, std::string_view raw, std::string_view prefix) {
    out.append(prefix);
    out.append(raw.substr(std::min(prefix.size(), raw.size())));
    out += '\n';
}

void
reverse_unified(std::string_view text, const Hunk& hunk, std::string& out) {
    out += render_unified_header(swapped_header(hunk.header));

    const auto& body = hunk.body;
    std::size_t i = 0;
    while (i < body.size()) {
        const auto kind = body[i].kind;
        if (kind != LineKind::Removed && kind != LineKind::Added && kind != LineKind::NoNewline) {
            append_line(out, "", raw_text(text, body[i]));
            i++;
            continue;
        }

        // One change group: the added lines come first once reversed.
        std::string now_removed;
        std::string now_added;
        LineKind last = LineKind::Other;
        for (; i < body.size(); i++) {
            const auto& line = body[i];
            if (line.kind == LineKind::Removed) {
                append_flipped(now_added, raw_text(text, line), "+");
            } else if (line.kind == LineKind::Added) {
                append_flipped(now_removed, raw_text(text, line), "-");
            } else if (line.kind == LineKind::NoNewline) {
                append_line(last == LineKind::Added ? now_removed : now_added, "", raw_text(text, line));
                continue;
            } else {
                break;
            }
            last = line.kind;
        }
        out += now_removed;
        out += now_added;
    }
}

void
reverse_context(std::string_view text, const Hunk& hunk, std::string& out) {
    auto swapped = swapped_header(hunk.header);

    std::string old_block;
    std::string new_block;
    bool in_new_block = false;
    for (const auto& line : hunk.body) {
        if (line.kind == LineKind::Separator) {
            in_new_block = true;
            continue;
        }
        auto raw = raw_text(text, line);
        if (in_new_block) {
            if (line.kind == LineKind::Added) {
                append_flipped(old_block, raw, "- ");
            } else {
                append_line(old_block, "", raw);
            }
        } else {
            if (line.kind == LineKind::Removed) {
                append_flipped(new_block, raw, "+ ");
            } else {
                append_line(new_block, "", raw);
            }
        }
    }

    out += render_context_header(swapped);
    out += old_block;
    out += render_context_mid_header(swapped);
    out += new_block;
}

void
reverse_normal(std::string_view text, const Hunk& hunk, std::string& out) {
    std::string old_block;
    std::string new_block;
    bool separator = false;
    LineKind last = LineKind::Other;
    for (const auto& line : hunk.body) {
        auto raw = raw_text(text, line);
        switch (line.kind) {
            case LineKind::Removed:
                append_flipped(new_block, raw, ">");
                break;
            case LineKind::Added:
                append_flipped(old_block, raw, "<");
                break;
            case LineKind::Separator:
                separator = true;
                break;
            default:
                append_line(last == LineKind::Added ? old_block : new_block, "", raw);
                break;
        }
        if (line.kind == LineKind::Removed || line.kind == LineKind::Added) {
            last = line.kind;
        }
    }

    out += render_normal_header(swapped_header(hunk.header));
    out += old_block;
    if (separator) {
        out += "---\n";
    }
    out += new_block;
}

Pos
unified_header_as_context(std::string_view text, Pos pos, std::string& out) {
    if (!is_unified_file_header(text, pos)) {
        return pos;
    }
    return write_file_header(text, pos, "*** ", "--- ", false, out);
}

Pos
context_header_as_unified(std::string_view text, Pos pos, std::string& out) {
    if (!is_context_file_header(text, pos)) {
        return pos;
    }
    return write_file_header(text, pos, "--- ", "+++ ", false, out);
}

Pos
reverse_file_header(std::string_view text, Pos pos, std::string& out) {
    if (is_unified_file_header(text, pos)) {
        return write_file_header(text, pos, "--- ", "+++ ", true, out);
    }
    if (is_context_file_header(text, pos)) {
        return write_file_header(text, pos, "*** ", "--- ", true, out);
    }
    return pos;
}

bool
reverse_hunk(std::string_view text, const Hunk& hunk, std::string& out, Conversion&) {
    switch (hunk.header.style) {
        case HunkStyle::Unified:
            reverse_unified(text, hunk, out);
            break;
        case HunkStyle::Context:
            reverse_context(text, hunk, out);
            break;
        case HunkStyle::Normal:
            reverse_normal(text, hunk, out);
            break;
    }
    return true;
}

}  // namespace

bool
patchy::unified_to_context(std::string_view text,
                           Span range,
                           const HunkParseOptions& options,
                           Conversion& conversion,
                           Error& error) {
    return convert_range(text, range, options, unified_header_as_context, write_unified_as_context, conversion,
                         error);
}

bool
patchy::context_to_unified(std::string_view text,
                           Span range,
                           const HunkParseOptions& options,
                           Conversion& conversion,
                           Error& error) {
    return convert_range(text, range, options, context_header_as_unified, write_context_as_unified, conversion,
                         error);
}

bool
patchy::convert(std::string_view text,
                Span range,
                bool to_context,
                const HunkParseOptions& options,
                Conversion& conversion,
                Error& error) {
    if (to_context) {
        return unified_to_context(text, range, options, conversion, error);
    }
    return context_to_unified(text, range, options, conversion, error);
}

bool
patchy::reverse_direction(std::string_view text,
                          Span range,
                          const HunkParseOptions& options,
                          Conversion& conversion,
                          Error& error) {
    return convert_range(text, range, options, reverse_file_header, reverse_hunk, conversion, error);
}
