#pragma once

/*
    A diff document: the diff text plus the file sections and hunks found in
    it.

    Sections and hunks are never stored; every call scans the current text.
    Edits go through DiffDocument so hunk headers can be kept consistent with
    their bodies, either right after each edit or once before the text is
    written out.
*/

#include "patch/diff_text.hpp"
#include "patch/hunk_parser.hpp"
#include "util/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchy {

struct HunkLine {
    LineKind kind = LineKind::Other;
    Span span;  // Without the newline
    bool has_newline = true;
};

struct Hunk {
    HunkHeader header;
    Span span;
    std::vector<HunkLine> body;

    // Lines on each side according to the body, ignoring the header.
    int64_t
    actual_old_count() const;

    int64_t
    actual_new_count() const;
};

bool
parse_hunk(std::string_view text,
           Pos hunk_start,
           const HunkParseOptions& options,
           Hunk& hunk,
           Error& error,
           bool trust_header = true);

struct FileSection {
    Span span;
    Span header;  // Everything before the first hunk

    std::string old_name;
    std::string new_name;
    std::string index_name;
    std::string git_old_name;
    std::string git_new_name;

    std::string old_mode;
    std::string new_mode;
    bool new_file = false;
    bool deleted_file = false;

    std::vector<Hunk> hunks;
};

std::vector<FileSection>
parse_sections(std::string_view text, const HunkParseOptions& options);

// Hunks of a section must be in increasing old-line order without overlap.
bool
check_section_order(const FileSection& section, Error& error);

enum class FixupPolicy {
    OnEdit,
    BeforeSave,
};

std::optional<FixupPolicy>
fixup_policy_from_string(const std::string& s);

std::string
repr(FixupPolicy policy);

class DiffDocument {
   public:
    explicit DiffDocument(std::string text,
                          HunkParseOptions options = HunkParseOptions{},
                          FixupPolicy policy = FixupPolicy::OnEdit);

    const std::string&
    text() const {
        return text_;
    }

    const HunkParseOptions&
    options() const {
        return options_;
    }

    std::vector<FileSection>
    sections() const {
        return parse_sections(text_, options_);
    }

    // Replace part of the text. With the on-edit policy the headers of the
    // edited hunk are fixed up right away.
    void
    replace(Span span, std::string_view replacement);

    // Changed range not yet fixed up.
    std::optional<Span>
    pending_change() const {
        return pending_;
    }

    // Fix up the headers of all hunks touched since the last fixup.
    bool
    flush_fixups();

    // Split the unified hunk at the line containing pos into two hunks.
    bool
    split_hunk(Pos pos, Error& error);

    // Remove the hunk containing pos, with its file header when it is the
    // only hunk of the file.
    bool
    kill_hunk(Pos pos, Error& error);

    // Remove the file section containing pos.
    bool
    kill_file(Pos pos, Error& error);

    bool
    sanity_check(Pos pos, const AutoFixPolicy& policy, Error& error);

   private:
    void
    record_change(Pos begin, std::size_t removed, std::size_t inserted);

    bool
    handle_pending_changes();

    std::string text_;
    HunkParseOptions options_;
    FixupPolicy policy_;
    std::optional<Span> pending_;
};

}  // namespace patchy
