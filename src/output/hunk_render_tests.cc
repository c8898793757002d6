#include "output/hunk_render.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

namespace {

std::string
rerender(const std::string& text) {
    Hunk hunk;
    Error error;
    REQUIRE(parse_hunk(text, 0, HunkParseOptions{}, hunk, error));
    REQUIRE(hunk.span.end == text.size());
    return render_hunk(text, hunk);
}

}  // namespace

TEST_CASE("hunk_render") {
    SUBCASE("ranges") {
        REQUIRE(render_unified_range({4, 1}, false) == "4");
        REQUIRE(render_unified_range({4, 0}, true) == "4,0");
        REQUIRE(render_end_range({4, 3}, true) == "4,6");
        REQUIRE(render_end_range({4, 1}, false) == "4");
    }

    SUBCASE("unified_identical") {
        std::string text = "@@ -10,3 +10,2 @@ void f()\n a\n-b\n c\n";
        REQUIRE(rerender(text) == text);
    }

    SUBCASE("unified_implicit_counts_identical") {
        std::string text = "@@ -1 +1 @@\n-a\n+b\n";
        REQUIRE(rerender(text) == text);
    }

    SUBCASE("no_newline_identical") {
        std::string text = "@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file";
        REQUIRE(rerender(text) == text);
    }

    SUBCASE("context_identical") {
        std::string text =
            "*************** int main()\n"
            "*** 1,2 ****\n"
            "! foo\n"
            "  baz\n"
            "--- 1,2 ----\n"
            "! bar\n"
            "  baz\n";
        REQUIRE(rerender(text) == text);
    }

    SUBCASE("context_omitted_block_identical") {
        std::string text =
            "***************\n"
            "*** 5 ****\n"
            "--- 5,6 ----\n"
            "  a\n"
            "+ b\n";
        REQUIRE(rerender(text) == text);
    }

    SUBCASE("normal_identical") {
        REQUIRE(rerender("3c3\n< a\n---\n> b\n") == "3c3\n< a\n---\n> b\n");
        REQUIRE(rerender("5a6,7\n> x\n> y\n") == "5a6,7\n> x\n> y\n");
        REQUIRE(rerender("2,3d1\n< p\n< q\n") == "2,3d1\n< p\n< q\n");
    }

    SUBCASE("new_header") {
        HunkHeader header;
        header.old_range = {3, 2};
        header.new_range = {4, 1};
        header.old_count_given = true;
        REQUIRE(render_header(header) == "@@ -3,2 +4 @@\n");

        header.style = HunkStyle::Context;
        header.new_count_given = true;
        REQUIRE(render_context_header(header) == "***************\n*** 3,4 ****\n");
        REQUIRE(render_context_mid_header(header) == "--- 4,4 ----\n");
    }
}
