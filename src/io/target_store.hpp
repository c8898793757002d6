#pragma once

/*
    Access to the files a patch applies to.

    A TargetStore hands out mutable in-memory buffers. Edits stay in the
    buffer until it is saved; nothing touches the underlying storage before
    that. FileTargetStore works on a directory tree, MemoryTargetStore keeps
    everything in memory and is what the tests use.
*/

#include "util/error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace patchy {

struct TargetBuffer {
    std::string path;
    std::string text;
    bool modified = false;

    // Not on disk yet; created by the patch.
    bool created = false;
};

class TargetStore {
   public:
    virtual ~TargetStore() = default;

    virtual bool
    exists(const std::string& path) const = 0;

    // The open buffer for path. Opening the same path twice returns the same
    // buffer. A missing file fails unless create_if_missing is set.
    virtual TargetBuffer*
    open(const std::string& path, bool create_if_missing, Error& error) = 0;

    // Text of path at a revision, from version control.
    virtual bool
    read_revision(const std::string& path, const std::string& revision, std::string& text, Error& error) = 0;

    virtual bool
    save(TargetBuffer& buffer, Error& error) = 0;

    virtual bool
    remove(const std::string& path, Error& error) = 0;

   protected:
    TargetBuffer*
    cached(const std::string& path);

    TargetBuffer*
    insert(const std::string& path, std::string text, bool created);

    void
    forget(const std::string& path);

   private:
    std::map<std::string, std::unique_ptr<TargetBuffer>> buffers_;
};

// Reads a revision of a file into text; returns false with an error set
// when the revision is not available.
using RevisionReader = std::function<bool(const std::string& path, const std::string& revision, std::string& text, Error& error)>;

class FileTargetStore : public TargetStore {
   public:
    explicit FileTargetStore(std::string root, RevisionReader revision_reader = nullptr);

    bool
    exists(const std::string& path) const override;

    TargetBuffer*
    open(const std::string& path, bool create_if_missing, Error& error) override;

    bool
    read_revision(const std::string& path, const std::string& revision, std::string& text, Error& error) override;

    bool
    save(TargetBuffer& buffer, Error& error) override;

    bool
    remove(const std::string& path, Error& error) override;

    std::string
    full_path(const std::string& path) const;

   private:
    std::string root_;
    RevisionReader revision_reader_;
};

class MemoryTargetStore : public TargetStore {
   public:
    void
    set_file(const std::string& path, std::string text);

    // Saved content of path, or nullopt when there is no such file.
    std::optional<std::string>
    file(const std::string& path) const;

    void
    add_revision(const std::string& path, const std::string& revision, std::string text);

    // Make every save of path fail.
    void
    fail_saves_for(const std::string& path);

    bool
    exists(const std::string& path) const override;

    TargetBuffer*
    open(const std::string& path, bool create_if_missing, Error& error) override;

    bool
    read_revision(const std::string& path, const std::string& revision, std::string& text, Error& error) override;

    bool
    save(TargetBuffer& buffer, Error& error) override;

    bool
    remove(const std::string& path, Error& error) override;

   private:
    std::map<std::string, std::string> files_;
    std::map<std::pair<std::string, std::string>, std::string> revisions_;
    std::set<std::string> failing_saves_;
};

enum class FileStatus {
    Ok,
    FileDoesNotExist,
    FileNotReadable,
    NoPermission,
    NullPath,
};

FileStatus
check_file_status(const std::string& path);

std::string
repr(FileStatus status);

bool
read_file(const std::string& path, std::string& text, Error& error);

bool
write_file(const std::string& path, const std::string& text, Error& error);

}  // namespace patchy
