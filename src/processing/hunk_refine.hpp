#pragma once

/*
    Refine a hunk: find which parts of changed lines actually differ.

    Removed lines are paired with the added lines that replace them (the
    "-" run and the "+" run after it for unified hunks, the "!" runs of the
    two blocks for context hunks, the two halves of a normal hunk). The
    tokens of each pair are diffed and every differing token span becomes a
    region. The hunk text is never modified.
*/

#include "patch/diff_text.hpp"
#include "patch/document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchy {

enum class RefineKind {
    Removed,
    Added,
    Changed,
};

std::string
repr(RefineKind kind);

struct RefineRegion {
    Span span;
    RefineKind kind = RefineKind::Changed;

    // Covers a whole line that has no counterpart on the other side.
    bool whole_line = false;
};

enum class RefineGranularity {
    Token,
    Char,
};

std::optional<RefineGranularity>
refine_granularity_from_string(const std::string& s);

std::string
repr(RefineGranularity granularity);

struct RefineOptions {
    RefineGranularity granularity = RefineGranularity::Token;

    // Pairs with more tokens than this, both sides together, are skipped.
    std::size_t max_tokens = 20000;

    bool tag_unpaired_lines = false;

    // Report both sides as Changed instead of Removed and Added.
    bool use_changed_kind = false;
};

std::vector<RefineRegion>
refine_hunk(std::string_view text, const Hunk& hunk, const RefineOptions& options);

}  // namespace patchy
