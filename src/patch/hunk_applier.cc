#include "hunk_applier.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <tuple>

using namespace patchy;

namespace {

// clang-format off
const std::vector<std::tuple<HunkOutcome, std::string>> kOutcomeNames = {
    { HunkOutcome::Applied, "applied" },
    { HunkOutcome::Skipped, "skipped" },
    { HunkOutcome::Tested,  "tested"  },
    { HunkOutcome::Deleted, "deleted" },
    { HunkOutcome::Failed,  "failed"  },
};
// clang-format on

struct HunkRef {
    const FileSection* section = nullptr;
    const Hunk* hunk = nullptr;
};

// The hunk containing pos, or the first one after it.
HunkRef
find_hunk(const std::vector<FileSection>& sections, Pos pos) {
    for (const auto& section : sections) {
        for (const auto& hunk : section.hunks) {
            if (hunk.span.contains(pos) || hunk.span.begin >= pos) {
                return {&section, &hunk};
            }
        }
    }
    return {};
}

int64_t
diff_line_of(std::string_view text, Pos pos) {
    return std::count(text.begin(), text.begin() + std::min(pos, text.size()), '\n') + 1;
}

bool
creates_file(const FileSection& section) {
    return is_null_device(section.old_name) || section.new_file;
}

bool
deletes_file(const FileSection& section) {
    return is_null_device(section.new_name) || section.deleted_file;
}

// Whether applying in this direction leaves no file behind, or starts from
// none.
bool
removes_target(const FileSection& section, bool reverse) {
    return reverse ? creates_file(section) : deletes_file(section);
}

bool
creates_target(const FileSection& section, bool reverse) {
    return reverse ? deletes_file(section) : creates_file(section);
}

bool
resolve_path(const FileSection& section,
             const ApplyOptions& options,
             ApplyContext& context,
             std::string& path,
             Error& error) {
    if (options.target) {
        path = *options.target;
        return true;
    }
    ResolvedTarget resolved;
    if (!resolve_target(section, context.store, options.files, resolved, error)) {
        return false;
    }
    path = resolved.path;
    return true;
}

TargetBuffer*
open_target(const FileSection& section,
            const ApplyOptions& options,
            ApplyContext& context,
            std::string& path,
            Error& error) {
    if (!resolve_path(section, options, context, path, error)) {
        return nullptr;
    }
    return context.store.open(path, creates_target(section, options.reverse), error);
}

bool
locate_hunk(const DiffDocument& document,
            const Hunk& hunk,
            std::string_view target_text,
            const ApplyOptions& options,
            ApplyContext& context,
            SourceLocation& location,
            Error& error) {
    LocateOptions locate_options;
    locate_options.reverse = options.reverse;
    locate_options.prefer_old_side = options.files.prefer_old;
    locate_options.fuzzy_max_chars = options.fuzzy_max_chars;
    return locate(document.text(), hunk.span, target_text, locate_options, context.parse_options, context.logger,
                  location, error);
}

HunkStatus&
failed(HunkStatus& status, ApplyContext& context) {
    status.outcome = HunkOutcome::Failed;
    status.message = status.error.message;
    context.logger.warning("Hunk at line {}: {}", status.diff_line, status.message);
    return status;
}

std::string
already_done_message(bool reverse) {
    return reverse ? "Hunk already undone" : "Hunk already applied";
}

bool
overlaps(const Span& a, const Span& b) {
    return (a.begin < b.end && b.begin < a.end) || a.begin == b.begin;
}

}  // namespace

std::string
patchy::repr(HunkOutcome outcome) {
    for (const auto& [value, name] : kOutcomeNames) {
        if (value == outcome) {
            return name;
        }
    }
    return "unknown";
}

std::string
patchy::hunk_status_message(int64_t line_offset, bool reversed, bool dry_run) {
    std::string what;
    if (dry_run) {
        what = reversed ? "already applied" : "not yet applied";
    } else {
        what = reversed ? "undone" : "applied";
    }

    if (line_offset == 0) {
        return fmt::format("Hunk {}", what);
    }
    return fmt::format("Hunk {} at offset {} line{}", what, line_offset, line_offset == 1 ? "" : "s");
}

HunkStatus
patchy::apply_hunk(const DiffDocument& document, Pos pos, const ApplyOptions& options, ApplyContext& context) {
    HunkStatus status;
    auto sections = document.sections();
    auto ref = find_hunk(sections, pos);
    if (ref.hunk == nullptr) {
        status.error.set(ErrorKind::MalformedHunk, "No hunk at point");
        return failed(status, context);
    }
    status.diff_line = diff_line_of(document.text(), ref.hunk->span.begin);

    std::string path;
    auto* buffer = open_target(*ref.section, options, context, path, status.error);
    if (buffer == nullptr) {
        return failed(status, context);
    }

    auto& location = status.location;
    if (!locate_hunk(document, *ref.hunk, buffer->text, options, context, location, status.error)) {
        return failed(status, context);
    }
    location.target = path;

    if (location.switched && !options.force) {
        status.outcome = HunkOutcome::Skipped;
        status.message = already_done_message(options.reverse);
        context.logger.info("{}: {}", path, status.message);
        return status;
    }

    if (!location.switched && removes_target(*ref.section, options.reverse)) {
        if (!context.store.remove(path, status.error)) {
            return failed(status, context);
        }
        status.outcome = HunkOutcome::Deleted;
        status.message = fmt::format("File {} deleted", path);
        context.logger.info("{}", status.message);
        return status;
    }

    // A switched hunk that gets here is forced; undo it.
    const std::string& replacement = location.switched ? location.from : location.to;
    buffer->text.replace(location.span.begin, location.span.size(), replacement);
    buffer->modified = true;

    if (options.save && !context.store.save(*buffer, status.error)) {
        return failed(status, context);
    }

    status.outcome = HunkOutcome::Applied;
    status.message = hunk_status_message(location.line_offset, location.switched != options.reverse, false);
    context.logger.info("{}: {}", path, status.message);
    return status;
}

HunkStatus
patchy::test_hunk(const DiffDocument& document, Pos pos, const ApplyOptions& options, ApplyContext& context) {
    HunkStatus status;
    auto sections = document.sections();
    auto ref = find_hunk(sections, pos);
    if (ref.hunk == nullptr) {
        status.error.set(ErrorKind::MalformedHunk, "No hunk at point");
        return failed(status, context);
    }
    status.diff_line = diff_line_of(document.text(), ref.hunk->span.begin);

    std::string path;
    std::string revision_text;
    std::string_view target_text;
    if (options.revision) {
        if (!resolve_path(*ref.section, options, context, path, status.error) ||
            !context.store.read_revision(path, *options.revision, revision_text, status.error)) {
            return failed(status, context);
        }
        target_text = revision_text;
    } else {
        auto* buffer = open_target(*ref.section, options, context, path, status.error);
        if (buffer == nullptr) {
            return failed(status, context);
        }
        target_text = buffer->text;
    }

    auto& location = status.location;
    if (!locate_hunk(document, *ref.hunk, target_text, options, context, location, status.error)) {
        return failed(status, context);
    }
    location.target = path;

    status.outcome = HunkOutcome::Tested;
    status.message = hunk_status_message(location.line_offset, location.switched != options.reverse, true);
    context.logger.info("{}: {}", path, status.message);
    return status;
}

BatchResult
patchy::apply_all(const DiffDocument& document, Span range, const ApplyOptions& options, ApplyContext& context) {
    struct PlannedEdit {
        std::string path;
        TargetBuffer* buffer = nullptr;
        Span span;
        std::string text;
        bool remove = false;
    };

    BatchResult result;
    std::vector<PlannedEdit> plan;

    // Plan every edit without changing anything.
    auto sections = document.sections();
    for (const auto& section : sections) {
        for (const auto& hunk : section.hunks) {
            if (hunk.span.begin < range.begin || hunk.span.begin >= range.end) {
                continue;
            }

            HunkStatus status;
            status.diff_line = diff_line_of(document.text(), hunk.span.begin);

            std::string path;
            auto* buffer = open_target(section, options, context, path, status.error);
            auto& location = status.location;
            if (buffer == nullptr ||
                !locate_hunk(document, hunk, buffer->text, options, context, location, status.error)) {
                result.statuses.push_back(failed(status, context));
                result.failures++;
                continue;
            }
            location.target = path;

            if (location.switched) {
                status.error.set(ErrorKind::NotFound, already_done_message(options.reverse));
                result.statuses.push_back(failed(status, context));
                result.failures++;
                continue;
            }

            PlannedEdit edit{path, buffer, location.span, location.to, removes_target(section, options.reverse)};
            bool overlapping = std::any_of(plan.begin(), plan.end(), [&](const PlannedEdit& other) {
                return other.path == edit.path && overlaps(other.span, edit.span);
            });
            if (overlapping) {
                status.error.set(ErrorKind::MalformedHunk, "Hunk overlaps an earlier hunk");
                result.statuses.push_back(failed(status, context));
                result.failures++;
                continue;
            }

            status.outcome = edit.remove ? HunkOutcome::Deleted : HunkOutcome::Applied;
            status.message = hunk_status_message(location.line_offset, options.reverse, false);
            result.statuses.push_back(status);
            plan.push_back(std::move(edit));
        }
    }

    if (result.failures > 0) {
        result.message = fmt::format("{} hunks failed; no buffers changed", result.failures);
        context.logger.error("{}", result.message);
        return result;
    }

    // Commit, one target at a time.
    std::vector<std::string> order;
    std::map<std::string, std::vector<const PlannedEdit*>> by_target;
    for (const auto& edit : plan) {
        auto& edits = by_target[edit.path];
        if (edits.empty()) {
            order.push_back(edit.path);
        }
        edits.push_back(&edit);
    }

    int saved = 0;
    for (const auto& path : order) {
        auto& edits = by_target[path];
        result.touched_targets.push_back(path);

        Error error;
        bool remove = std::any_of(edits.begin(), edits.end(), [](const PlannedEdit* edit) { return edit->remove; });
        bool ok = false;
        if (remove) {
            ok = context.store.remove(path, error);
        } else {
            std::sort(edits.begin(), edits.end(),
                      [](const PlannedEdit* a, const PlannedEdit* b) { return a->span.begin > b->span.begin; });
            auto* buffer = edits.front()->buffer;
            for (const auto* edit : edits) {
                buffer->text.replace(edit->span.begin, edit->span.size(), edit->text);
            }
            buffer->modified = true;
            ok = context.store.save(*buffer, error);
        }

        if (!ok) {
            context.logger.error("{}", error.message);
            result.save_failures++;
            continue;
        }
        saved++;
    }

    result.message = fmt::format("Saved {} buffers", saved);
    context.logger.info("{}", result.message);
    return result;
}
