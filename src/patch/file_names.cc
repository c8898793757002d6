#include "file_names.hpp"

#include "patch/document.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace patchy;

namespace {

void
add_candidate(std::vector<std::string>& names, const std::string& name) {
    if (name.empty() || is_null_device(name)) {
        return;
    }
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

std::string
unquote(std::string_view name) {
    std::string out;
    for (std::size_t i = 1; i + 1 < name.size(); i++) {
        char c = name[i];
        if (c != '\\' || i + 2 >= name.size()) {
            out += c;
            continue;
        }
        char next = name[++i];
        switch (next) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += next;
                break;
        }
    }
    return out;
}

}  // namespace

bool
patchy::is_null_device(std::string_view name) {
    return name == "/dev/null" || name == "nul" || name == "NUL";
}

std::string
patchy::clean_file_name(std::string_view raw) {
    auto tab = raw.find('\t');
    if (tab != std::string_view::npos) {
        raw = raw.substr(0, tab);
    }
    while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\r')) {
        raw.remove_suffix(1);
    }
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        return unquote(raw);
    }
    return std::string{raw};
}

std::optional<std::string>
patchy::strip_file_name(std::string_view name, int count) {
    while (count-- > 0) {
        auto slash = name.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        name = name.substr(slash + 1);
        while (!name.empty() && name.front() == '/') {
            name.remove_prefix(1);
        }
    }
    if (name.empty()) {
        return std::nullopt;
    }
    return std::string{name};
}

std::vector<std::string>
patchy::candidate_file_names(const FileSection& section, bool prefer_old) {
    std::vector<std::string> names;
    if (prefer_old) {
        add_candidate(names, section.old_name);
        add_candidate(names, section.new_name);
    } else {
        add_candidate(names, section.new_name);
        add_candidate(names, section.old_name);
    }
    add_candidate(names, section.index_name);
    if (prefer_old) {
        add_candidate(names, section.git_old_name);
        add_candidate(names, section.git_new_name);
    } else {
        add_candidate(names, section.git_new_name);
        add_candidate(names, section.git_old_name);
    }
    return names;
}

bool
patchy::resolve_target(const FileSection& section,
                       const TargetStore& store,
                       const FileNameOptions& options,
                       ResolvedTarget& target,
                       Error& error) {
    target = ResolvedTarget{};
    target.create = is_null_device(section.old_name) || section.new_file;
    target.remove = is_null_device(section.new_name) || section.deleted_file;

    auto names = candidate_file_names(section, options.prefer_old);
    if (names.empty()) {
        return error.set(ErrorKind::NotFound, "No file name in the file header");
    }

    for (const auto& name : names) {
        if (options.strip >= 0) {
            auto stripped = strip_file_name(name, options.strip);
            if (stripped && store.exists(*stripped)) {
                target.path = *stripped;
                return true;
            }
            continue;
        }
        for (int strip = 0;; strip++) {
            auto stripped = strip_file_name(name, strip);
            if (!stripped) {
                break;
            }
            if (store.exists(*stripped)) {
                target.path = *stripped;
                return true;
            }
        }
    }

    // A file the patch creates does not exist yet.
    if (target.create) {
        int strip = options.strip;
        if (strip < 0) {
            strip = starts_with(names.front(), "b/") ? 1 : 0;
        }
        if (auto stripped = strip_file_name(names.front(), strip)) {
            target.path = *stripped;
            return true;
        }
    }

    return error.set(ErrorKind::NotFound, fmt::format("Can't find the file to patch: {}", names.front()));
}
