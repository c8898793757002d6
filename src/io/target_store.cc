#include "target_store.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace patchy;

TargetBuffer*
TargetStore::cached(const std::string& path) {
    auto it = buffers_.find(path);
    return it == buffers_.end() ? nullptr : it->second.get();
}

TargetBuffer*
TargetStore::insert(const std::string& path, std::string text, bool created) {
    auto buffer = std::make_unique<TargetBuffer>();
    buffer->path = path;
    buffer->text = std::move(text);
    buffer->created = created;
    auto* raw = buffer.get();
    buffers_[path] = std::move(buffer);
    return raw;
}

void
TargetStore::forget(const std::string& path) {
    buffers_.erase(path);
}

FileStatus
patchy::check_file_status(const std::string& path) {
    if (path.empty() || path == "/dev/null" || path == "nul") {
        return FileStatus::NullPath;
    }

    fs::path file_path(path);
    std::error_code ec;

    if (!fs::exists(file_path, ec)) {
        return FileStatus::FileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_symlink(file_path, ec))) {
        return FileStatus::FileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none)) {
        return FileStatus::NoPermission;
    }

    return FileStatus::Ok;
}

std::string
patchy::repr(FileStatus status) {
    switch (status) {
        case FileStatus::Ok:
            return "Success";
        case FileStatus::FileDoesNotExist:
            return "File does not exist";
        case FileStatus::FileNotReadable:
            return "File is not readable (invalid file)";
        case FileStatus::NoPermission:
            return "File is not readable (no permission)";
        case FileStatus::NullPath:
            return "Null path";
    }
    return "Unknown error";
}

bool
patchy::read_file(const std::string& path, std::string& text, Error& error) {
    auto status = check_file_status(path);
    if (status != FileStatus::Ok) {
        return error.set(status == FileStatus::FileDoesNotExist ? ErrorKind::NotFound : ErrorKind::IO,
                         fmt::format("{}: {}", path, repr(status)));
    }

    std::ifstream ifs;
    ifs.open(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        return error.set(ErrorKind::IO, fmt::format("{}: Failed to open file for reading", path));
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        return error.set(ErrorKind::IO, fmt::format("{}: Read error", path));
    }
    text = buffer.str();
    return true;
}

bool
patchy::write_file(const std::string& path, const std::string& text, Error& error) {
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        return error.set(ErrorKind::IO, fmt::format("Failed to open '{}' for writing: {}", path, strerror(errno)));
    }

    bool ok = text.empty() || fwrite(text.data(), text.size(), 1, f) == 1;
    if (fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        return error.set(ErrorKind::IO, fmt::format("Failed to write '{}': {}", path, strerror(errno)));
    }
    return true;
}

FileTargetStore::FileTargetStore(std::string root, RevisionReader revision_reader)
    : root_(std::move(root)), revision_reader_(std::move(revision_reader)) {
}

std::string
FileTargetStore::full_path(const std::string& path) const {
    if (root_.empty() || fs::path(path).is_absolute()) {
        return path;
    }
    return (fs::path(root_) / path).string();
}

bool
FileTargetStore::exists(const std::string& path) const {
    return check_file_status(full_path(path)) == FileStatus::Ok;
}

TargetBuffer*
FileTargetStore::open(const std::string& path, bool create_if_missing, Error& error) {
    if (auto* buffer = cached(path)) {
        return buffer;
    }

    auto full = full_path(path);
    auto status = check_file_status(full);
    if (status == FileStatus::FileDoesNotExist && create_if_missing) {
        return insert(path, {}, true);
    }

    std::string text;
    if (!read_file(full, text, error)) {
        return nullptr;
    }
    return insert(path, std::move(text), false);
}

bool
FileTargetStore::read_revision(const std::string& path,
                               const std::string& revision,
                               std::string& text,
                               Error& error) {
    if (!revision_reader_) {
        return error.set(ErrorKind::IO, fmt::format("{}: No revision reader for revision {}", path, revision));
    }
    return revision_reader_(full_path(path), revision, text, error);
}

bool
FileTargetStore::save(TargetBuffer& buffer, Error& error) {
    auto full = full_path(buffer.path);
    if (buffer.created) {
        std::error_code ec;
        auto parent = fs::path(full).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                return error.set(ErrorKind::IO,
                                 fmt::format("Failed to create '{}': {}", parent.string(), ec.message()));
            }
        }
    }
    if (!write_file(full, buffer.text, error)) {
        return false;
    }
    buffer.modified = false;
    buffer.created = false;
    return true;
}

bool
FileTargetStore::remove(const std::string& path, Error& error) {
    std::error_code ec;
    auto full = full_path(path);
    if (!fs::remove(full, ec)) {
        return error.set(ErrorKind::IO,
                         fmt::format("Failed to remove '{}': {}", full, ec ? ec.message() : "No such file"));
    }
    forget(path);
    return true;
}

void
MemoryTargetStore::set_file(const std::string& path, std::string text) {
    files_[path] = std::move(text);
}

std::optional<std::string>
MemoryTargetStore::file(const std::string& path) const {
    auto it = files_.find(path);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void
MemoryTargetStore::add_revision(const std::string& path, const std::string& revision, std::string text) {
    revisions_[{path, revision}] = std::move(text);
}

void
MemoryTargetStore::fail_saves_for(const std::string& path) {
    failing_saves_.insert(path);
}

bool
MemoryTargetStore::exists(const std::string& path) const {
    return files_.count(path) != 0;
}

TargetBuffer*
MemoryTargetStore::open(const std::string& path, bool create_if_missing, Error& error) {
    if (auto* buffer = cached(path)) {
        return buffer;
    }
    auto it = files_.find(path);
    if (it == files_.end()) {
        if (create_if_missing) {
            return insert(path, {}, true);
        }
        error.set(ErrorKind::NotFound, fmt::format("{}: File does not exist", path));
        return nullptr;
    }
    return insert(path, it->second, false);
}

bool
MemoryTargetStore::read_revision(const std::string& path,
                                 const std::string& revision,
                                 std::string& text,
                                 Error& error) {
    auto it = revisions_.find({path, revision});
    if (it == revisions_.end()) {
        return error.set(ErrorKind::NotFound, fmt::format("{}: No revision {}", path, revision));
    }
    text = it->second;
    return true;
}

bool
MemoryTargetStore::save(TargetBuffer& buffer, Error& error) {
    if (failing_saves_.count(buffer.path)) {
        return error.set(ErrorKind::IO, fmt::format("Failed to open '{}' for writing", buffer.path));
    }
    files_[buffer.path] = buffer.text;
    buffer.modified = false;
    buffer.created = false;
    return true;
}

bool
MemoryTargetStore::remove(const std::string& path, Error& error) {
    if (files_.erase(path) == 0) {
        return error.set(ErrorKind::IO, fmt::format("Failed to remove '{}': No such file", path));
    }
    forget(path);
    return true;
}
