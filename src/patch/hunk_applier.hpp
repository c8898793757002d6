#pragma once

/*
    Apply, undo and test hunks against their target files.

    apply_all plans every edit of a batch before touching anything: when
    any hunk fails to plan, no target is changed. Otherwise the edits of
    each target are applied from the bottom up and every touched target is
    saved (or removed, for deleted files).
*/

#include "io/target_store.hpp"
#include "patch/document.hpp"
#include "patch/file_names.hpp"
#include "patch/source_locator.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

#include <optional>
#include <string>
#include <vector>

namespace patchy {

struct ApplyOptions {
    bool reverse = false;

    // Undo a hunk that is already applied instead of skipping it.
    bool force = false;

    // apply_hunk: save the target right away.
    bool save = false;

    FileNameOptions files;
    std::size_t fuzzy_max_chars = 8192;

    // Patch this file instead of the one named in the diff.
    std::optional<std::string> target;

    // Search a revision of the target instead of its current text. Only for
    // operations that do not change the target.
    std::optional<std::string> revision;
};

struct ApplyContext {
    TargetStore& store;
    Logger& logger;
    HunkParseOptions parse_options;
};

enum class HunkOutcome {
    Applied,
    Skipped,
    Tested,
    Deleted,
    Failed,
};

std::string
repr(HunkOutcome outcome);

struct HunkStatus {
    HunkOutcome outcome = HunkOutcome::Failed;

    // 1-based line of the hunk header in the diff.
    int64_t diff_line = 0;

    SourceLocation location;
    std::string message;
    Error error;
};

// "Hunk applied at offset 3 lines" and friends.
std::string
hunk_status_message(int64_t line_offset, bool reversed, bool dry_run);

HunkStatus
apply_hunk(const DiffDocument& document, Pos pos, const ApplyOptions& options, ApplyContext& context);

HunkStatus
test_hunk(const DiffDocument& document, Pos pos, const ApplyOptions& options, ApplyContext& context);

struct BatchResult {
    int failures = 0;
    int save_failures = 0;
    std::vector<std::string> touched_targets;
    std::vector<HunkStatus> statuses;
    std::string message;
};

// Apply every hunk starting in range, all or nothing.
BatchResult
apply_all(const DiffDocument& document, Span range, const ApplyOptions& options, ApplyContext& context);

}  // namespace patchy
