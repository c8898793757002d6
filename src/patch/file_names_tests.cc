#include "patch/file_names.hpp"

#include "patch/document.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("file_names") {
    SUBCASE("clean") {
        REQUIRE(clean_file_name("a/foo.c\t2020-01-01 10:00:00.000000000 +0100") == "a/foo.c");
        REQUIRE(clean_file_name("foo.c  ") == "foo.c");
        REQUIRE(clean_file_name("\"a/with space\\tand tab\"") == "a/with space\tand tab");
    }

    SUBCASE("strip") {
        REQUIRE(strip_file_name("a/src/foo.c", 0) == "a/src/foo.c");
        REQUIRE(strip_file_name("a/src/foo.c", 1) == "src/foo.c");
        REQUIRE(strip_file_name("a//src/foo.c", 1) == "src/foo.c");
        REQUIRE(strip_file_name("a/src/foo.c", 2) == "foo.c");
        REQUIRE(!strip_file_name("a/src/foo.c", 3).has_value());
    }

    SUBCASE("null_device") {
        REQUIRE(is_null_device("/dev/null"));
        REQUIRE(!is_null_device("/dev/nullx"));
    }

    SUBCASE("candidates") {
        FileSection section;
        section.old_name = "a/old.c";
        section.new_name = "b/new.c";
        section.index_name = "new.c";

        auto names = candidate_file_names(section, false);
        REQUIRE(names == std::vector<std::string>{"b/new.c", "a/old.c", "new.c"});
        names = candidate_file_names(section, true);
        REQUIRE(names.front() == "a/old.c");
    }

    SUBCASE("resolve_strips_prefix") {
        MemoryTargetStore store;
        store.set_file("src/foo.c", "x\n");

        FileSection section;
        section.old_name = "a/src/foo.c";
        section.new_name = "b/src/foo.c";

        ResolvedTarget target;
        Error error;
        REQUIRE(resolve_target(section, store, FileNameOptions{}, target, error));
        REQUIRE(target.path == "src/foo.c");
        REQUIRE(!target.create);
        REQUIRE(!target.remove);
    }

    SUBCASE("resolve_fixed_strip") {
        MemoryTargetStore store;
        store.set_file("foo.c", "x\n");

        FileSection section;
        section.old_name = "a/src/foo.c";
        section.new_name = "b/src/foo.c";

        FileNameOptions options;
        options.strip = 1;
        ResolvedTarget target;
        Error error;
        REQUIRE(!resolve_target(section, store, options, target, error));
        REQUIRE(error.kind == ErrorKind::NotFound);

        options.strip = 2;
        REQUIRE(resolve_target(section, store, options, target, error));
        REQUIRE(target.path == "foo.c");
    }

    SUBCASE("resolve_created_file") {
        MemoryTargetStore store;

        FileSection section;
        section.old_name = "/dev/null";
        section.new_name = "b/docs/new.txt";

        ResolvedTarget target;
        Error error;
        REQUIRE(resolve_target(section, store, FileNameOptions{}, target, error));
        REQUIRE(target.create);
        REQUIRE(target.path == "docs/new.txt");
    }

    SUBCASE("resolve_deleted_file") {
        MemoryTargetStore store;
        store.set_file("gone.txt", "bye\n");

        FileSection section;
        section.old_name = "a/gone.txt";
        section.new_name = "/dev/null";

        ResolvedTarget target;
        Error error;
        REQUIRE(resolve_target(section, store, FileNameOptions{}, target, error));
        REQUIRE(target.remove);
        REQUIRE(target.path == "gone.txt");
    }
}
