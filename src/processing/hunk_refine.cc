#include "hunk_refine.hpp"

#include "algorithms/myers_greedy.hpp"
#include "processing/tokenizer.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <tuple>

using namespace patchy;

namespace {

// clang-format off
const std::vector<std::tuple<RefineGranularity, std::string>> kGranularityNames = {
    { RefineGranularity::Token, "token" },
    { RefineGranularity::Char,  "char"  },
};
// clang-format on

// A token at an absolute position in the diff text.
struct TokenEdit {
    Pos pos;
    Token token;

    bool
    operator==(const TokenEdit& other) const {
        return token == other.token;
    }
};

using LineRun = std::vector<const HunkLine*>;

struct LinePair {
    LineRun old_lines;
    LineRun new_lines;
};

struct Pairing {
    std::vector<LinePair> pairs;
    LineRun unpaired_old;
    LineRun unpaired_new;
};

// Runs of lines of one kind; "\ No newline" markers do not break a run.
std::vector<LineRun>
runs_of(const std::vector<HunkLine>& lines, std::size_t begin, std::size_t end, LineKind kind) {
    std::vector<LineRun> runs;
    bool in_run = false;
    for (std::size_t i = begin; i < end; i++) {
        if (lines[i].kind == kind) {
            if (!in_run) {
                runs.emplace_back();
                in_run = true;
            }
            runs.back().push_back(&lines[i]);
        } else if (lines[i].kind != LineKind::NoNewline) {
            in_run = false;
        }
    }
    return runs;
}

Pairing
pair_unified(const Hunk& hunk) {
    Pairing pairing;
    const auto& body = hunk.body;
    std::size_t i = 0;
    while (i < body.size()) {
        LineRun removed;
        while (i < body.size() && (body[i].kind == LineKind::Removed || body[i].kind == LineKind::NoNewline)) {
            if (body[i].kind == LineKind::Removed) {
                removed.push_back(&body[i]);
            }
            i++;
        }
        LineRun added;
        while (i < body.size() && (body[i].kind == LineKind::Added || body[i].kind == LineKind::NoNewline)) {
            if (body[i].kind == LineKind::Added) {
                added.push_back(&body[i]);
            }
            i++;
        }

        if (!removed.empty() && !added.empty()) {
            pairing.pairs.push_back({removed, added});
        } else {
            pairing.unpaired_old.insert(pairing.unpaired_old.end(), removed.begin(), removed.end());
            pairing.unpaired_new.insert(pairing.unpaired_new.end(), added.begin(), added.end());
        }

        if (removed.empty() && added.empty()) {
            i++;
        }
    }
    return pairing;
}

Pairing
pair_context(const Hunk& hunk) {
    Pairing pairing;
    const auto& body = hunk.body;
    std::size_t separator = 0;
    while (separator < body.size() && body[separator].kind != LineKind::Separator) {
        separator++;
    }

    auto old_runs = runs_of(body, 0, separator, LineKind::ChangedBang);
    auto new_runs = runs_of(body, std::min(separator + 1, body.size()), body.size(), LineKind::ChangedBang);
    std::size_t n = std::min(old_runs.size(), new_runs.size());
    for (std::size_t i = 0; i < n; i++) {
        pairing.pairs.push_back({old_runs[i], new_runs[i]});
    }
    for (std::size_t i = n; i < old_runs.size(); i++) {
        pairing.unpaired_old.insert(pairing.unpaired_old.end(), old_runs[i].begin(), old_runs[i].end());
    }
    for (std::size_t i = n; i < new_runs.size(); i++) {
        pairing.unpaired_new.insert(pairing.unpaired_new.end(), new_runs[i].begin(), new_runs[i].end());
    }

    for (std::size_t i = 0; i < body.size(); i++) {
        if (i < separator && body[i].kind == LineKind::Removed) {
            pairing.unpaired_old.push_back(&body[i]);
        } else if (i > separator && body[i].kind == LineKind::Added) {
            pairing.unpaired_new.push_back(&body[i]);
        }
    }
    return pairing;
}

Pairing
pair_normal(const Hunk& hunk) {
    Pairing pairing;
    LineRun old_lines;
    LineRun new_lines;
    for (const auto& line : hunk.body) {
        if (line.kind == LineKind::Removed) {
            old_lines.push_back(&line);
        } else if (line.kind == LineKind::Added) {
            new_lines.push_back(&line);
        }
    }
    if (!old_lines.empty() && !new_lines.empty()) {
        pairing.pairs.push_back({old_lines, new_lines});
    } else {
        pairing.unpaired_old = old_lines;
        pairing.unpaired_new = new_lines;
    }
    return pairing;
}

Span
content_span(const HunkLine& line, HunkStyle style) {
    return {std::min(line.span.begin + prefix_length(style), line.span.end), line.span.end};
}

std::vector<TokenEdit>
tokenize_run(std::string_view text, const LineRun& lines, HunkStyle style, RefineGranularity granularity) {
    static const Token kNewline{0, 1, hash::hash("\n", 1), TokenFlagLF};

    std::vector<TokenEdit> tokens;
    for (const auto* line : lines) {
        auto span = content_span(*line, style);
        auto content = text.substr(span.begin, span.size());
        auto line_tokens = granularity == RefineGranularity::Char ? tokenize_chars(content) : tokenize(content);
        for (const auto& token : line_tokens) {
            tokens.push_back({span.begin + token.start, token});
        }
        if (line->has_newline) {
            tokens.push_back({line->span.end, kNewline});
        }
    }
    return tokens;
}

void
add_region(std::vector<RefineRegion>& regions, const TokenEdit& edit, RefineKind kind) {
    if (edit.token.flags & TokenFlagNewline) {
        return;
    }
    Span span{edit.pos, edit.pos + edit.token.length};
    if (!regions.empty() && regions.back().kind == kind && !regions.back().whole_line &&
        regions.back().span.end == span.begin) {
        regions.back().span.end = span.end;
        return;
    }
    regions.push_back({span, kind, false});
}

void
refine_pair(std::string_view text,
            const LinePair& pair,
            HunkStyle style,
            const RefineOptions& options,
            std::vector<RefineRegion>& regions) {
    auto a = tokenize_run(text, pair.old_lines, style, options.granularity);
    auto b = tokenize_run(text, pair.new_lines, style, options.granularity);
    if (a.size() + b.size() > options.max_tokens) {
        return;
    }

    DiffInput<TokenEdit> input{a, b};
    auto result = MyersGreedy<TokenEdit>(input).compute();
    if (result.status != DiffResultStatus::OK) {
        return;
    }

    const RefineKind removed = options.use_changed_kind ? RefineKind::Changed : RefineKind::Removed;
    const RefineKind added = options.use_changed_kind ? RefineKind::Changed : RefineKind::Added;

    // Removed regions first, then added ones, each in text order.
    std::vector<RefineRegion> new_side;
    for (const auto& edit : result.edit_sequence) {
        if (edit.type == EditType::Delete) {
            add_region(regions, a[static_cast<size_t>(edit.a_index.value)], removed);
        } else if (edit.type == EditType::Insert) {
            add_region(new_side, b[static_cast<size_t>(edit.b_index.value)], added);
        }
    }
    regions.insert(regions.end(), new_side.begin(), new_side.end());
}

}  // namespace

std::string
patchy::repr(RefineKind kind) {
    switch (kind) {
        case RefineKind::Removed:
            return "removed";
        case RefineKind::Added:
            return "added";
        case RefineKind::Changed:
            return "changed";
    }
    return "unknown";
}

std::optional<RefineGranularity>
patchy::refine_granularity_from_string(const std::string& s) {
    for (const auto& [granularity, name] : kGranularityNames) {
        if (name == s) {
            return granularity;
        }
    }
    return std::nullopt;
}

std::string
patchy::repr(RefineGranularity granularity) {
    for (const auto& [value, name] : kGranularityNames) {
        if (value == granularity) {
            return name;
        }
    }
    return "unknown";
}

std::vector<RefineRegion>
patchy::refine_hunk(std::string_view text, const Hunk& hunk, const RefineOptions& options) {
    const auto style = hunk.header.style;

    Pairing pairing;
    switch (style) {
        case HunkStyle::Unified:
            pairing = pair_unified(hunk);
            break;
        case HunkStyle::Context:
            pairing = pair_context(hunk);
            break;
        case HunkStyle::Normal:
            pairing = pair_normal(hunk);
            break;
    }

    std::vector<RefineRegion> regions;
    for (const auto& pair : pairing.pairs) {
        refine_pair(text, pair, style, options, regions);
    }

    if (options.tag_unpaired_lines) {
        for (const auto* line : pairing.unpaired_old) {
            regions.push_back({content_span(*line, style), RefineKind::Removed, true});
        }
        for (const auto* line : pairing.unpaired_new) {
            regions.push_back({content_span(*line, style), RefineKind::Added, true});
        }
    }

    std::stable_sort(regions.begin(), regions.end(),
                     [](const RefineRegion& a, const RefineRegion& b) { return a.span.begin < b.span.begin; });
    return regions;
}
