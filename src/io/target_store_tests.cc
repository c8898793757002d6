#include "io/target_store.hpp"

#include <doctest.h>

#include <filesystem>

namespace fs = std::filesystem;

using namespace patchy;

TEST_CASE("target_store") {
    SUBCASE("memory_open_and_save") {
        MemoryTargetStore store;
        store.set_file("a.txt", "one\n");

        Error error;
        auto* buffer = store.open("a.txt", false, error);
        REQUIRE(buffer != nullptr);
        REQUIRE(buffer->text == "one\n");
        REQUIRE(store.open("a.txt", false, error) == buffer);

        buffer->text = "two\n";
        buffer->modified = true;
        REQUIRE(store.file("a.txt") == "one\n");

        REQUIRE(store.save(*buffer, error));
        REQUIRE(!buffer->modified);
        REQUIRE(store.file("a.txt") == "two\n");
    }

    SUBCASE("memory_missing") {
        MemoryTargetStore store;
        Error error;
        REQUIRE(store.open("nope.txt", false, error) == nullptr);
        REQUIRE(error.kind == ErrorKind::NotFound);

        auto* created = store.open("nope.txt", true, error);
        REQUIRE(created != nullptr);
        REQUIRE(created->created);
        REQUIRE(created->text.empty());
    }

    SUBCASE("memory_failures") {
        MemoryTargetStore store;
        store.set_file("a.txt", "one\n");
        store.fail_saves_for("a.txt");

        Error error;
        auto* buffer = store.open("a.txt", false, error);
        REQUIRE(!store.save(*buffer, error));
        REQUIRE(error.kind == ErrorKind::IO);

        REQUIRE(store.remove("a.txt", error));
        REQUIRE(!store.exists("a.txt"));
        REQUIRE(!store.remove("a.txt", error));
    }

    SUBCASE("memory_revisions") {
        MemoryTargetStore store;
        store.add_revision("a.txt", "HEAD", "old\n");

        std::string text;
        Error error;
        REQUIRE(store.read_revision("a.txt", "HEAD", text, error));
        REQUIRE(text == "old\n");
        REQUIRE(!store.read_revision("a.txt", "HEAD~1", text, error));
    }

    SUBCASE("filesystem") {
        auto root = fs::temp_directory_path() / "patchy_target_store_tests";
        fs::remove_all(root);
        fs::create_directories(root);

        Error error;
        REQUIRE(write_file((root / "a.txt").string(), "hello\n", error));

        FileTargetStore store(root.string());
        REQUIRE(store.exists("a.txt"));
        REQUIRE(!store.exists("b.txt"));

        auto* buffer = store.open("a.txt", false, error);
        REQUIRE(buffer != nullptr);
        REQUIRE(buffer->text == "hello\n");

        buffer->text = "bye\n";
        REQUIRE(store.save(*buffer, error));
        std::string text;
        REQUIRE(read_file((root / "a.txt").string(), text, error));
        REQUIRE(text == "bye\n");

        auto* created = store.open("sub/new.txt", true, error);
        REQUIRE(created != nullptr);
        created->text = "new\n";
        REQUIRE(store.save(*created, error));
        REQUIRE(store.exists("sub/new.txt"));

        REQUIRE(store.remove("a.txt", error));
        REQUIRE(!store.exists("a.txt"));

        REQUIRE(!store.read_revision("a.txt", "HEAD", text, error));

        fs::remove_all(root);
    }

    SUBCASE("file_status") {
        REQUIRE(check_file_status("/dev/null") == FileStatus::NullPath);
        REQUIRE(check_file_status("/this/does/not/exist") == FileStatus::FileDoesNotExist);
        REQUIRE(repr(FileStatus::NullPath) == "Null path");
    }
}
