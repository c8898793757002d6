#include "patch/document.hpp"

#include "output/hunk_render.hpp"
#include "patch/file_names.hpp"
#include "patch/header_fixup.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <tuple>

using namespace patchy;

namespace {

// clang-format off
const std::vector<std::tuple<FixupPolicy, std::string>> kFixupPolicyNames = {
    { FixupPolicy::OnEdit,     "on-edit"     },
    { FixupPolicy::BeforeSave, "before-save" },
};
// clang-format on

// "diff --git a/x b/y": split on the last " b/".
void
parse_git_names(std::string_view line, FileSection& section) {
    auto rest = line.substr(std::string_view{"diff --git "}.size());
    auto split = rest.rfind(" b/");
    if (split == std::string_view::npos) {
        split = rest.find(' ');
        if (split == std::string_view::npos) {
            return;
        }
    }
    section.git_old_name = std::string{rest.substr(0, split)};
    section.git_new_name = std::string{rest.substr(split + 1)};
}

void
parse_metadata_line(std::string_view line, FileSection& section) {
    auto value_after = [&](std::string_view prefix) { return std::string{line.substr(prefix.size())}; };

    if (starts_with(line, "old mode ")) {
        section.old_mode = value_after("old mode ");
    } else if (starts_with(line, "new mode ")) {
        section.new_mode = value_after("new mode ");
    } else if (starts_with(line, "new file mode ")) {
        section.new_file = true;
        section.new_mode = value_after("new file mode ");
    } else if (starts_with(line, "deleted file mode ")) {
        section.deleted_file = true;
        section.old_mode = value_after("deleted file mode ");
    }
}

}  // namespace

int64_t
Hunk::actual_old_count() const {
    int64_t count = 0;
    switch (header.style) {
        case HunkStyle::Unified:
            for (const auto& line : body) {
                count += line.kind == LineKind::Context || line.kind == LineKind::Removed;
            }
            break;
        case HunkStyle::Context: {
            bool old_block_empty = body.empty() || body.front().kind == LineKind::Separator;
            bool in_old_block = true;
            for (const auto& line : body) {
                if (line.kind == LineKind::Separator) {
                    in_old_block = false;
                    continue;
                }
                if (old_block_empty) {
                    count += line.kind == LineKind::Context;
                } else if (in_old_block) {
                    count += line.kind == LineKind::Context || line.kind == LineKind::Removed ||
                             line.kind == LineKind::ChangedBang;
                }
            }
        } break;
        case HunkStyle::Normal:
            for (const auto& line : body) {
                count += line.kind == LineKind::Removed;
            }
            break;
    }
    return count;
}

int64_t
Hunk::actual_new_count() const {
    int64_t count = 0;
    switch (header.style) {
        case HunkStyle::Unified:
            for (const auto& line : body) {
                count += line.kind == LineKind::Context || line.kind == LineKind::Added;
            }
            break;
        case HunkStyle::Context: {
            auto separator = std::find_if(body.begin(), body.end(),
                                          [](const HunkLine& line) { return line.kind == LineKind::Separator; });
            bool new_block_empty = separator == body.end() || separator + 1 == body.end();
            bool in_new_block = false;
            for (const auto& line : body) {
                if (line.kind == LineKind::Separator) {
                    in_new_block = true;
                    continue;
                }
                if (new_block_empty) {
                    count += line.kind == LineKind::Context;
                } else if (in_new_block) {
                    count += line.kind == LineKind::Context || line.kind == LineKind::Added ||
                             line.kind == LineKind::ChangedBang;
                }
            }
        } break;
        case HunkStyle::Normal:
            for (const auto& line : body) {
                count += line.kind == LineKind::Added;
            }
            break;
    }
    return count;
}

bool
patchy::parse_hunk(std::string_view text,
                   Pos hunk_start,
                   const HunkParseOptions& options,
                   Hunk& hunk,
                   Error& error,
                   bool trust_header) {
    hunk = Hunk{};
    hunk_start = line_begin(text, hunk_start);
    if (!parse_header(text, hunk_start, hunk.header, error, options)) {
        return false;
    }

    Pos end = end_of_hunk(text, hunk.header, trust_header, options);
    hunk.span = {hunk_start, end};

    const auto style = hunk.header.style;
    Pos pos = hunk_body_start(hunk.header);
    while (pos < end) {
        Pos le = line_end(text, pos);
        auto kind = classify_line(text.substr(pos, le - pos), style, options.valid_unified_empty_line);
        hunk.body.push_back({kind, {pos, le}, le < text.size()});
        pos = next_line(text, pos);
    }
    return true;
}

std::vector<FileSection>
patchy::parse_sections(std::string_view text, const HunkParseOptions& options) {
    std::vector<FileSection> sections;

    bool saw_diff_line = false;
    bool saw_index_line = false;
    bool saw_file_header = false;

    auto close_section = [&](Pos end) {
        if (sections.empty()) {
            return;
        }
        auto& section = sections.back();
        section.span.end = end;
        section.header = {section.span.begin, section.hunks.empty() ? end : section.hunks.front().span.begin};
    };

    auto open_section = [&](Pos begin) {
        close_section(begin);
        sections.emplace_back();
        sections.back().span = {begin, begin};
        saw_diff_line = false;
        saw_index_line = false;
        saw_file_header = false;
    };

    Pos pos = 0;
    while (pos < text.size()) {
        auto line = line_at(text, pos);

        if (is_hunk_header(text, pos)) {
            Hunk hunk;
            Error error;
            if (parse_hunk(text, pos, options, hunk, error)) {
                if (sections.empty()) {
                    open_section(pos);
                }
                Pos next = std::max(hunk.span.end, next_line(text, pos));
                sections.back().hunks.push_back(std::move(hunk));
                pos = next;
                continue;
            }
        }

        const bool unified_pair = is_unified_file_header(text, pos);
        const bool context_pair = !unified_pair && is_context_file_header(text, pos);
        const bool diff_line = starts_with(line, "diff ");
        const bool index_line = starts_with(line, "Index: ");

        if (unified_pair || context_pair || diff_line || index_line) {
            bool new_section = sections.empty() || !sections.back().hunks.empty() || saw_file_header ||
                               (diff_line && saw_diff_line) || (index_line && (saw_index_line || saw_diff_line));
            if (new_section) {
                open_section(pos);
            }
            auto& section = sections.back();

            if (unified_pair || context_pair) {
                Pos second = next_line(text, pos);
                section.old_name = clean_file_name(line.substr(4));
                section.new_name = clean_file_name(line_at(text, second).substr(4));
                saw_file_header = true;
                pos = next_line(text, second);
                continue;
            }

            if (diff_line) {
                saw_diff_line = true;
                if (starts_with(line, "diff --git ")) {
                    parse_git_names(line, section);
                }
            } else {
                saw_index_line = true;
                section.index_name = clean_file_name(line.substr(std::string_view{"Index: "}.size()));
            }
            pos = next_line(text, pos);
            continue;
        }

        if (!sections.empty() && sections.back().hunks.empty()) {
            parse_metadata_line(line, sections.back());
        }
        pos = next_line(text, pos);
    }

    close_section(text.size());
    return sections;
}

bool
patchy::check_section_order(const FileSection& section, Error& error) {
    for (std::size_t i = 1; i < section.hunks.size(); i++) {
        const auto& prev = section.hunks[i - 1].header.old_range;
        const auto& next = section.hunks[i].header.old_range;
        if (next.start <= prev.start || next.start < prev.start + prev.count) {
            return error.set(ErrorKind::MalformedHunk,
                             fmt::format("Hunk at old line {} overlaps or precedes the hunk at old line {}",
                                         next.start, prev.start));
        }
    }
    return true;
}

std::optional<FixupPolicy>
patchy::fixup_policy_from_string(const std::string& s) {
    for (const auto& [policy, name] : kFixupPolicyNames) {
        if (name == s) {
            return policy;
        }
    }
    return std::nullopt;
}

std::string
patchy::repr(FixupPolicy policy) {
    for (const auto& [value, name] : kFixupPolicyNames) {
        if (value == policy) {
            return name;
        }
    }
    return "unknown";
}

DiffDocument::DiffDocument(std::string text, HunkParseOptions options, FixupPolicy policy)
    : text_(std::move(text)), options_(options), policy_(policy) {
}

void
DiffDocument::replace(Span span, std::string_view replacement) {
    span.end = std::min(span.end, text_.size());
    span.begin = std::min(span.begin, span.end);

    text_.replace(span.begin, span.size(), replacement);
    record_change(span.begin, span.size(), replacement.size());

    if (policy_ == FixupPolicy::OnEdit) {
        handle_pending_changes();
    }
}

void
DiffDocument::record_change(Pos begin, std::size_t removed, std::size_t inserted) {
    Span changed{begin, begin + inserted};
    if (!pending_) {
        pending_ = changed;
        return;
    }

    // Move the earlier range along with the text it covers.
    auto shift = [&](Pos pos) -> Pos {
        if (pos >= begin + removed) {
            return pos + inserted - removed;
        }
        return pos > begin ? begin + inserted : pos;
    };
    Span earlier{shift(pending_->begin), shift(pending_->end)};
    pending_ = Span{std::min(earlier.begin, changed.begin), std::max(earlier.end, changed.end)};
}

bool
DiffDocument::handle_pending_changes() {
    if (!pending_) {
        return false;
    }
    const Span changed = *pending_;
    pending_.reset();

    // An edit starting at a line start may have cut the end of the hunk
    // before it.
    Pos pos = changed.begin;
    if (pos > 0 && pos == line_begin(text_, pos)) {
        pos--;
    }

    auto bounds = find_hunk_bounds(text_, pos, options_, false);
    if (!bounds) {
        return false;
    }

    HunkHeader header;
    Error error;
    if (!parse_header(text_, bounds->begin, header, error, options_)) {
        return false;
    }

    // Edits of the header lines or the mid header are left alone; the
    // counts there may be deliberate.
    if (changed.begin < hunk_body_start(header)) {
        return false;
    }
    if (header.mid_header) {
        Pos mid_end = line_end(text_, header.mid_header->begin);
        if (!(changed.end < header.mid_header->begin || changed.begin > mid_end)) {
            return false;
        }
    }
    if (end_of_hunk(text_, header, false, options_) < changed.end) {
        return false;
    }

    return fixup_hunk_headers(text_, {bounds->begin, changed.end}, options_);
}

bool
DiffDocument::flush_fixups() {
    if (!pending_) {
        return false;
    }
    Span range = *pending_;
    pending_.reset();

    if (auto bounds = find_hunk_bounds(text_, range.begin, options_, false); bounds && bounds->begin <= range.begin) {
        range.begin = bounds->begin;
    }
    return fixup_hunk_headers(text_, range, options_);
}

bool
DiffDocument::split_hunk(Pos pos, Error& error) {
    Pos at = line_begin(text_, pos);
    auto bounds = find_hunk_bounds(text_, at, options_, false);
    if (!bounds || !bounds->contains(at)) {
        return error.set(ErrorKind::MalformedHunk, "Not inside a hunk");
    }

    HunkHeader header;
    if (!parse_header(text_, bounds->begin, header, error, options_)) {
        return false;
    }
    if (header.style != HunkStyle::Unified) {
        return error.set(ErrorKind::MalformedHunk, "Only unified hunks can be split");
    }
    if (at <= hunk_body_start(header)) {
        return error.set(ErrorKind::MalformedHunk, "Can't split a hunk at its first line");
    }

    int64_t old_before = 0;
    int64_t new_before = 0;
    for (Pos p = hunk_body_start(header); p < at; p = next_line(text_, p)) {
        switch (classify_line(line_at(text_, p), HunkStyle::Unified, options_.valid_unified_empty_line)) {
            case LineKind::Context:
                old_before++;
                new_before++;
                break;
            case LineKind::Removed:
                old_before++;
                break;
            case LineKind::Added:
                new_before++;
                break;
            default:
                break;
        }
    }

    HunkHeader second;
    second.style = HunkStyle::Unified;
    second.old_range = {header.old_range.start + old_before, 1};
    second.new_range = {header.new_range.start + new_before, 1};
    second.old_count_given = true;
    second.new_count_given = true;

    auto inserted = render_unified_header(second);
    text_.insert(at, inserted);
    fixup_hunk_headers(text_, {bounds->begin, at + inserted.size()}, options_);
    return true;
}

bool
DiffDocument::kill_hunk(Pos pos, Error& error) {
    for (const auto& section : sections()) {
        for (const auto& hunk : section.hunks) {
            if (!hunk.span.contains(pos)) {
                continue;
            }

            Span doomed = hunk.span;
            if (section.hunks.size() == 1) {
                // Only blank lines between the hunk and the next file?
                Pos p = hunk.span.end;
                while (p < section.span.end && line_at(text_, p).empty()) {
                    p = next_line(text_, p);
                }
                if (p >= section.span.end) {
                    doomed = section.span;
                }
            }
            text_.erase(doomed.begin, doomed.size());
            pending_.reset();
            return true;
        }
    }
    return error.set(ErrorKind::MalformedHunk, "No hunk at point");
}

bool
DiffDocument::kill_file(Pos pos, Error& error) {
    for (const auto& section : sections()) {
        if (section.span.contains(pos) || (pos == text_.size() && section.span.end == pos && !section.span.empty())) {
            text_.erase(section.span.begin, section.span.size());
            pending_.reset();
            return true;
        }
    }
    return error.set(ErrorKind::MalformedHunk, "No file section at point");
}

bool
DiffDocument::sanity_check(Pos pos, const AutoFixPolicy& policy, Error& error) {
    auto bounds = find_hunk_bounds(text_, pos, options_);
    if (!bounds) {
        return error.set(ErrorKind::MalformedHunk, "No hunk at point");
    }
    return sanity_check_hunk(text_, bounds->begin, policy, options_, error);
}
