#pragma once

/*
    File names in diff headers, and which target file a section patches.

    Names are taken from the "---"/"+++" (or "***"/"---") header, the
    "Index:" line and the "diff --git" line. A name is tried as written
    and then with leading directories dropped one at a time, unless a
    fixed number of components to strip is given.
*/

#include "io/target_store.hpp"
#include "util/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchy {

struct FileSection;

bool
is_null_device(std::string_view name);

// Cut the timestamp after a tab and trailing whitespace, and unquote a
// git style "quoted" name.
std::string
clean_file_name(std::string_view raw);

// Drop count leading directories; nullopt when there are not enough.
std::optional<std::string>
strip_file_name(std::string_view name, int count);

// Names to try, most preferred first, without duplicates or null devices.
std::vector<std::string>
candidate_file_names(const FileSection& section, bool prefer_old);

struct FileNameOptions {
    bool prefer_old = false;

    // Leading directories to strip; negative tries every amount.
    int strip = -1;
};

struct ResolvedTarget {
    std::string path;

    // The patch creates the file (old side is the null device).
    bool create = false;

    // The patch deletes the file (new side is the null device).
    bool remove = false;
};

bool
resolve_target(const FileSection& section,
               const TargetStore& store,
               const FileNameOptions& options,
               ResolvedTarget& target,
               Error& error);

}  // namespace patchy
