#include "patch/format_converter.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

namespace {

Conversion
to_context(const std::string& text) {
    Conversion conversion;
    Error error;
    REQUIRE(unified_to_context(text, {0, text.size()}, HunkParseOptions{}, conversion, error));
    return conversion;
}

Conversion
to_unified(const std::string& text) {
    Conversion conversion;
    Error error;
    REQUIRE(context_to_unified(text, {0, text.size()}, HunkParseOptions{}, conversion, error));
    return conversion;
}

std::string
reversed(const std::string& text) {
    Conversion conversion;
    Error error;
    REQUIRE(reverse_direction(text, {0, text.size()}, HunkParseOptions{}, conversion, error));
    return conversion.text;
}

void
check_round_trip(const std::string& unified, const std::string& context) {
    auto conversion = to_context(unified);
    REQUIRE(conversion.reversible);
    REQUIRE(conversion.text == context);
    REQUIRE(to_unified(conversion.text).text == unified);
}

}  // namespace

TEST_CASE("format_converter") {
    SUBCASE("round_trip_substitution") {
        check_round_trip(
            "--- a/f\n"
            "+++ b/f\n"
            "@@ -1,2 +1,2 @@\n"
            "-foo\n"
            "+bar\n"
            " baz\n",

            "*** a/f\n"
            "--- b/f\n"
            "***************\n"
            "*** 1,2 ****\n"
            "! foo\n"
            "  baz\n"
            "--- 1,2 ----\n"
            "! bar\n"
            "  baz\n");
    }

    SUBCASE("round_trip_add_only") {
        check_round_trip(
            "@@ -0,0 +1,2 @@\n"
            "+a\n"
            "+b\n",

            "***************\n"
            "*** 0 ****\n"
            "--- 1,2 ----\n"
            "+ a\n"
            "+ b\n");
    }

    SUBCASE("round_trip_delete_only") {
        check_round_trip(
            "@@ -1,3 +1,2 @@\n"
            " a\n"
            "-b\n"
            " c\n",

            "***************\n"
            "*** 1,3 ****\n"
            "  a\n"
            "- b\n"
            "  c\n"
            "--- 1,2 ----\n");
    }

    SUBCASE("round_trip_insert_with_context") {
        check_round_trip(
            "@@ -1,2 +1,3 @@\n"
            " a\n"
            "+b\n"
            " c\n",

            "***************\n"
            "*** 1,2 ****\n"
            "--- 1,3 ----\n"
            "  a\n"
            "+ b\n"
            "  c\n");
    }

    SUBCASE("heading") {
        auto conversion = to_context("@@ -5,1 +5,1 @@ int main()\n-x\n+y\n");
        REQUIRE(conversion.text == "*************** int main()\n*** 5,5 ****\n! x\n--- 5,5 ----\n! y\n");
        REQUIRE(to_unified(conversion.text).text == "@@ -5,1 +5,1 @@ int main()\n-x\n+y\n");
    }

    SUBCASE("irreversible") {
        auto conversion = to_context("@@ -1 +1 @@\n-a\n+b\n");
        REQUIRE(!conversion.reversible);
        REQUIRE(conversion.text == "***************\n*** 1,1 ****\n! a\n--- 1,1 ----\n! b\n");

        REQUIRE(!to_context("@@ -1,2 +1,2 @@\n\n-a\n+b\n").reversible);
        REQUIRE(!to_context("@@ -1,2 +1,2 @@\n+b\n-a\n c\n").reversible);
        REQUIRE(!to_context("@@ -1,1 +1,1 @@\n-a\n\\ No newline at end of file\n+b\n").reversible);
    }

    SUBCASE("irreversible_interleaved_substitutions") {
        auto conversion = to_context("@@ -1,2 +1,2 @@\n-a\n+b\n-c\n+d\n");
        REQUIRE(!conversion.reversible);
        REQUIRE(conversion.text == "***************\n*** 1,2 ****\n! a\n! c\n--- 1,2 ----\n! b\n! d\n");
        REQUIRE(to_unified(conversion.text).text == "@@ -1,2 +1,2 @@\n-a\n-c\n+b\n+d\n");
    }

    SUBCASE("junk_and_range") {
        std::string text =
            "Some mail text\n"
            "@@ -1 +1 @@\n"
            "-a\n"
            "+b\n"
            "@@ -5,1 +5,1 @@\n"
            "-c\n"
            "+d\n"
            "-- \n"
            "2.30.0\n";
        Pos second = text.find("@@ -5");
        Conversion conversion;
        Error error;
        REQUIRE(unified_to_context(text, {second, text.size()}, HunkParseOptions{}, conversion, error));
        REQUIRE(conversion.hunks == 1);
        REQUIRE(conversion.text ==
                "Some mail text\n"
                "@@ -1 +1 @@\n"
                "-a\n"
                "+b\n"
                "***************\n"
                "*** 5,5 ****\n"
                "! c\n"
                "--- 5,5 ----\n"
                "! d\n"
                "-- \n"
                "2.30.0\n");

        REQUIRE(conversion.mappings.size() == 1);
        REQUIRE(conversion.mappings[0].from == Span{second, text.find("-- \n")});
        REQUIRE(conversion.mappings[0].to.begin == second);
        REQUIRE(conversion.text.substr(conversion.mappings[0].to.end) == "-- \n2.30.0\n");
    }

    SUBCASE("toggle") {
        std::string unified = "@@ -1,2 +1,2 @@\n-foo\n+bar\n baz\n";
        Conversion conversion;
        Error error;
        REQUIRE(convert(unified, {0, unified.size()}, true, HunkParseOptions{}, conversion, error));
        std::string context = conversion.text;
        REQUIRE(convert(context, {0, context.size()}, false, HunkParseOptions{}, conversion, error));
        REQUIRE(conversion.text == unified);
    }

    SUBCASE("malformed") {
        std::string text = "***************\n*** 1,2 ****\n! a\n";
        Conversion conversion;
        Error error;
        REQUIRE(!context_to_unified(text, {0, text.size()}, HunkParseOptions{}, conversion, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);
    }
}

TEST_CASE("reverse_direction") {
    SUBCASE("unified") {
        std::string text =
            "--- a/f\t2020-01-01\n"
            "+++ b/f\t2020-01-02\n"
            "@@ -1,3 +1,2 @@\n"
            " a\n"
            "-b\n"
            "-c\n"
            "+d\n";
        std::string expected =
            "--- b/f\t2020-01-02\n"
            "+++ a/f\t2020-01-01\n"
            "@@ -1,2 +1,3 @@\n"
            " a\n"
            "-d\n"
            "+b\n"
            "+c\n";
        REQUIRE(reversed(text) == expected);
        REQUIRE(reversed(expected) == text);
    }

    SUBCASE("unified_textual_ranges") {
        REQUIRE(reversed("@@ -3 +3,2 @@\n-x\n+y\n+z\n") == "@@ -3,2 +3 @@\n-y\n-z\n+x\n");
    }

    SUBCASE("unified_no_newline") {
        std::string text = "@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file";
        REQUIRE(reversed(text) == "@@ -1 +1 @@\n-b\n\\ No newline at end of file\n+a\n\\ No newline at end of file");
    }

    SUBCASE("context") {
        std::string text =
            "***************\n"
            "*** 1,2 ****\n"
            "! foo\n"
            "  baz\n"
            "--- 1,2 ----\n"
            "! bar\n"
            "  baz\n";
        std::string expected =
            "***************\n"
            "*** 1,2 ****\n"
            "! bar\n"
            "  baz\n"
            "--- 1,2 ----\n"
            "! foo\n"
            "  baz\n";
        REQUIRE(reversed(text) == expected);
    }

    SUBCASE("context_omitted_block") {
        std::string text =
            "***************\n"
            "*** 1,2 ****\n"
            "- a\n"
            "  b\n"
            "--- 1 ----\n";
        std::string expected =
            "***************\n"
            "*** 1 ****\n"
            "--- 1,2 ----\n"
            "+ a\n"
            "  b\n";
        REQUIRE(reversed(text) == expected);
        REQUIRE(reversed(expected) == text);
    }

    SUBCASE("normal") {
        REQUIRE(reversed("5a6,7\n> x\n> y\n") == "6,7d5\n< x\n< y\n");
        REQUIRE(reversed("2,3d1\n< p\n< q\n") == "1a2,3\n> p\n> q\n");
        REQUIRE(reversed("3c3\n< a\n---\n> b\n") == "3c3\n< b\n---\n> a\n");
    }
}
