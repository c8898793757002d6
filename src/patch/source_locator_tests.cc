#include "patch/source_locator.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

namespace {

const std::string kHunk = "@@ -1,2 +1,2 @@\n-foo\n+bar\n baz\n";

struct Located {
    bool ok = false;
    SourceLocation location;
    Error error;
};

Located
locate_in(const std::string& target, const LocateOptions& options = LocateOptions{}, const std::string& diff = kHunk) {
    Logger logger;
    logger.level = LogLevel::Quiet;
    Located result;
    result.ok = locate(diff, {0, diff.size()}, target, options, HunkParseOptions{}, logger, result.location,
                       result.error);
    return result;
}

}  // namespace

TEST_CASE("source_locator") {
    SUBCASE("line_position") {
        std::string text = "a\nb\nc\n";
        REQUIRE(line_position(text, 0) == 0);
        REQUIRE(line_position(text, 1) == 0);
        REQUIRE(line_position(text, 2) == 2);
        REQUIRE(line_position(text, 3) == 4);
        REQUIRE(line_position(text, 4) == 6);
        REQUIRE(line_position(text, 10) == 6);
    }

    SUBCASE("find_text_closest") {
        std::string text = "x\nfoo\ny\nfoo\n";
        REQUIRE(find_text(text, "foo\n", 6) == Span{8, 12});
        REQUIRE(find_text(text, "foo\n", 0) == Span{2, 6});
        REQUIRE(find_text(text, "foo\n", text.size()) == Span{8, 12});
    }

    SUBCASE("find_text_tie_goes_forward") {
        std::string text = "foo\nx\nfoo\n";
        REQUIRE(find_text(text, "foo\n", 3) == Span{6, 10});
    }

    SUBCASE("find_text_line_aligned") {
        REQUIRE(!find_text("xfoo\n", "foo\n", 0).has_value());
        REQUIRE(find_text("abc\n", "", 0) == Span{0, 0});
    }

    SUBCASE("fuzzy_pattern") {
        REQUIRE(fuzzy_pattern("foo bar\n") ==
                "[ \\t\\r\\f\\v]*foo[ \\t\\n\\r\\f\\v]+bar[ \\t\\r\\f\\v]*(?:\\n|$)");
        REQUIRE(fuzzy_pattern("a.b(c)\n") == "[ \\t\\r\\f\\v]*a\\.b\\(c\\)[ \\t\\r\\f\\v]*(?:\\n|$)");
        REQUIRE(fuzzy_pattern(" \n\t").empty());
    }

    SUBCASE("find_fuzzy") {
        Logger logger;
        logger.level = LogLevel::Quiet;
        std::string text = "first\n  int   x =  1;\nlast\n";
        REQUIRE(find_fuzzy(text, "int x = 1;\n", 0, 8192, logger) == Span{6, 22});
        REQUIRE(!find_fuzzy(text, "int y = 1;\n", 0, 8192, logger).has_value());
    }

    SUBCASE("find_fuzzy_keeps_trailing_blank_lines") {
        Logger logger;
        logger.level = LogLevel::Quiet;
        std::string text = "foo   \nbaz\n\n\nend\n";
        REQUIRE(find_fuzzy(text, "foo\nbaz\n", 0, 8192, logger) == Span{0, 11});
    }

    SUBCASE("find_fuzzy_long_blank_run") {
        Logger logger;
        logger.level = LogLevel::Quiet;
        std::string text = "x\n" + std::string(100000, '\n') + "foo   \nbaz\n";
        Pos foo = 2 + 100000;
        REQUIRE(find_fuzzy(text, "foo\nbaz\n", 0, 8192, logger) == Span{foo, foo + 11});

        // A gap wider than the search window is not bridged.
        std::string split = "foo\n" + std::string(100000, '\n') + "baz\n";
        REQUIRE(!find_fuzzy(split, "foo\nbaz\n", 0, 8192, logger).has_value());
    }

    SUBCASE("find_fuzzy_capped") {
        std::vector<std::string> messages;
        Logger logger;
        logger.level = LogLevel::Debug;
        logger.capture = &messages;

        std::string needle(100, 'x');
        REQUIRE(!find_fuzzy(needle, needle, 0, 50, logger).has_value());
        REQUIRE(messages.size() == 1);
        REQUIRE(messages[0] == "Hunk text too long for a fuzzy search (100 > 50 characters)");
    }

    SUBCASE("scenario_exact") {
        auto r = locate_in("foo\nbaz\n");
        REQUIRE(r.ok);
        REQUIRE(r.location.span == Span{0, 8});
        REQUIRE(r.location.line_offset == 0);
        REQUIRE(!r.location.switched);
        REQUIRE(!r.location.fuzzy);
        REQUIRE(r.location.from == "foo\nbaz\n");
        REQUIRE(r.location.to == "bar\nbaz\n");
    }

    SUBCASE("scenario_already_applied") {
        auto r = locate_in("bar\nbaz\n");
        REQUIRE(r.ok);
        REQUIRE(r.location.switched);
        REQUIRE(r.location.span == Span{0, 8});
    }

    SUBCASE("scenario_fuzzy") {
        auto r = locate_in("foo   \nbaz\n");
        REQUIRE(r.ok);
        REQUIRE(r.location.fuzzy);
        REQUIRE(!r.location.switched);
        REQUIRE(r.location.line_offset == 0);
        REQUIRE(r.location.span == Span{0, 11});
    }

    SUBCASE("offset") {
        auto r = locate_in("x\ny\nfoo\nbaz\n");
        REQUIRE(r.ok);
        REQUIRE(r.location.line_offset == 2);
        REQUIRE(r.location.span == Span{4, 12});
    }

    SUBCASE("reverse") {
        LocateOptions options;
        options.reverse = true;

        auto r = locate_in("bar\nbaz\n", options);
        REQUIRE(r.ok);
        REQUIRE(!r.location.switched);
        REQUIRE(r.location.from == "bar\nbaz\n");

        r = locate_in("foo\nbaz\n", options);
        REQUIRE(r.ok);
        REQUIRE(r.location.switched);
    }

    SUBCASE("not_found") {
        auto r = locate_in("nothing here\n");
        REQUIRE(!r.ok);
        REQUIRE(r.error.kind == ErrorKind::NotFound);
        REQUIRE(r.error.message == "Hunk text not found");
    }

    SUBCASE("idempotent") {
        std::string target = "a\nfoo\nbaz\nfoo\nbaz\n";
        auto first = locate_in(target);
        auto second = locate_in(target);
        REQUIRE(first.ok);
        REQUIRE(second.ok);
        REQUIRE(first.location.span == second.location.span);
        REQUIRE(first.location.line_offset == second.location.line_offset);
        REQUIRE(first.location.switched == second.location.switched);
        REQUIRE(first.location.from == second.location.from);
    }

    SUBCASE("empty_range_declared_line") {
        std::string diff = "@@ -2,0 +3,1 @@\n+new\n";
        auto r = locate_in("a\nb\nc\n", LocateOptions{}, diff);
        REQUIRE(r.ok);
        REQUIRE(r.location.span == Span{4, 4});
        REQUIRE(r.location.line_offset == 0);

        LocateOptions options;
        options.prefer_old_side = true;
        r = locate_in("a\nb\nc\n", options, diff);
        REQUIRE(r.ok);
        REQUIRE(r.location.span == Span{4, 4});
    }
}
