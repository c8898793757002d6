#include "patch/hunk_parser.hpp"

#include <doctest.h>

#include <optional>
#include <string>
#include <vector>

using namespace patchy;

namespace {

const std::string kUnified = "@@ -1,2 +1,2 @@\n-foo\n+bar\n baz\n";

const std::string kContext =
    "***************\n"
    "*** 1,2 ****\n"
    "! foo\n"
    "  baz\n"
    "--- 1,2 ----\n"
    "! bar\n"
    "  baz\n";

HunkHeader
header_of(const std::string& text, Pos pos = 0) {
    HunkHeader header;
    Error error;
    REQUIRE(parse_header(text, pos, header, error));
    return header;
}

std::string
side_of(const std::string& text, bool want_new, Pos begin = 0) {
    HunkParseOptions options;
    auto bounds = find_hunk_bounds(text, begin, options);
    REQUIRE(bounds.has_value());
    HunkText result;
    Error error;
    REQUIRE(extract_hunk_text(text, *bounds, want_new, std::nullopt, options, result, error));
    return result.text;
}

}  // namespace

TEST_CASE("hunk_parser") {
    SUBCASE("unified_header") {
        auto h = header_of(kUnified);
        REQUIRE(h.style == HunkStyle::Unified);
        REQUIRE(h.old_range.start == 1);
        REQUIRE(h.old_range.count == 2);
        REQUIRE(h.new_range.start == 1);
        REQUIRE(h.new_range.count == 2);
        REQUIRE(h.old_count_given);
        REQUIRE(h.heading.empty());
        REQUIRE(h.header == Span{0, 16});
    }

    SUBCASE("unified_header_implicit_counts") {
        auto h = header_of("@@ -5 +5,0 @@ int main()\n-x\n");
        REQUIRE(h.old_range.count == 1);
        REQUIRE(!h.old_count_given);
        REQUIRE(h.new_range.count == 0);
        REQUIRE(h.new_count_given);
        REQUIRE(h.heading == " int main()");
    }

    SUBCASE("malformed") {
        HunkHeader h;
        Error error;
        REQUIRE(!parse_header("@@ -x +1 @@\n", 0, h, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);

        error.clear();
        REQUIRE(!parse_header("just text\n", 0, h, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);
    }

    SUBCASE("oversized_line_numbers") {
        HunkHeader h;
        Error error;
        REQUIRE(!parse_header("@@ -99999999999999999999 +1 @@\n-a\n+b\n", 0, h, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);

        error.clear();
        REQUIRE(!parse_header("1,99999999999999999999c1\n< a\n---\n> b\n", 0, h, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);

        error.clear();
        REQUIRE(parse_header("@@ -9223372036854775807 +1 @@\n", 0, h, error));
        REQUIRE(h.old_range.start == 9223372036854775807);

        int64_t start = 0;
        std::optional<int64_t> end;
        REQUIRE(parse_context_range_line("*** 3,5 ****", "*** ", " ****", start, end));
        REQUIRE(start == 3);
        REQUIRE(end == 5);
        REQUIRE(!parse_context_range_line("--- 1,99999999999999999999 ----", "--- ", " ----", start, end));
    }

    SUBCASE("context_header") {
        auto h = header_of(kContext);
        REQUIRE(h.style == HunkStyle::Context);
        REQUIRE(h.old_range.start == 1);
        REQUIRE(h.old_range.count == 2);
        REQUIRE(h.new_range.count == 2);
        REQUIRE(h.mid_header.has_value());
        REQUIRE(kContext.substr(h.mid_header->begin, h.mid_header->size()) == "--- 1,2 ----\n");
    }

    SUBCASE("context_omitted_block_counts") {
        std::string with_context =
            "***************\n"
            "*** 3 ****\n"
            "--- 3,4 ----\n"
            "+ new\n"
            "  ctx\n";
        auto h = header_of(with_context);
        REQUIRE(h.old_range.count == 1);
        REQUIRE(h.new_range.count == 2);

        std::string pure_insert =
            "***************\n"
            "*** 0 ****\n"
            "--- 1 ----\n"
            "+ new\n";
        h = header_of(pure_insert);
        REQUIRE(h.old_range.count == 0);
        REQUIRE(h.new_range.count == 1);
    }

    SUBCASE("normal_header") {
        auto h = header_of("2a3,4\n> x\n> y\n");
        REQUIRE(h.style == HunkStyle::Normal);
        REQUIRE(h.normal_op == 'a');
        REQUIRE(h.old_range.start == 2);
        REQUIRE(h.old_range.count == 0);
        REQUIRE(h.new_range.start == 3);
        REQUIRE(h.new_range.count == 2);

        h = header_of("5,7d4\n< a\n< b\n< c\n");
        REQUIRE(h.old_range.count == 3);
        REQUIRE(h.new_range.count == 0);

        h = header_of("3c3\n< a\n---\n> b\n");
        REQUIRE(h.old_range.count == 1);
        REQUIRE(h.new_range.count == 1);
    }

    SUBCASE("end_of_hunk_trusted_and_scanned") {
        std::string text = kUnified + "\n@@ -10 +10 @@\n-x\n+y\n";
        auto h = header_of(text);
        HunkParseOptions options;
        REQUIRE(end_of_hunk(text, h, true, options) == kUnified.size());
        REQUIRE(end_of_hunk(text, h, false, options) == kUnified.size());
    }

    SUBCASE("end_of_hunk_untrusted_follows_edits") {
        // The header claims one line per side but the body has grown.
        std::string text = "@@ -1 +1 @@\n-foo\n+bar\n+more\n ctx\n--- a\n+++ b\n";
        auto h = header_of(text);
        HunkParseOptions options;
        Pos scanned = end_of_hunk(text, h, false, options);
        REQUIRE(text.substr(scanned) == "--- a\n+++ b\n");
        Pos trusted = end_of_hunk(text, h, true, options);
        REQUIRE(text.substr(trusted) == "+more\n ctx\n--- a\n+++ b\n");
    }

    SUBCASE("end_of_hunk_no_newline_marker") {
        std::string text = "@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file\n";
        auto h = header_of(text);
        REQUIRE(end_of_hunk(text, h, true, HunkParseOptions{}) == text.size());
    }

    SUBCASE("bounds_and_navigation") {
        std::string text = "--- a\n+++ b\n" + kUnified + "@@ -10 +10 @@\n-x\n+y\n";
        HunkParseOptions options;

        // From inside the file header, the next hunk is found.
        auto first = find_hunk_bounds(text, 2, options);
        REQUIRE(first.has_value());
        REQUIRE(first->begin == 12);
        REQUIRE(first->end == 12 + kUnified.size());

        // Inside the body of the second hunk.
        auto second = find_hunk_bounds(text, text.size() - 2, options);
        REQUIRE(second.has_value());
        REQUIRE(second->begin == first->end);
        REQUIRE(second->end == text.size());

        REQUIRE(next_hunk(text, first->begin) == second->begin);
        REQUIRE(previous_hunk(text, second->begin) == first->begin);
        REQUIRE(!previous_hunk(text, first->begin).has_value());
        REQUIRE(!next_hunk(text, second->begin).has_value());
        REQUIRE(!find_hunk_bounds(text, text.size(), options).has_value());
    }

    SUBCASE("extract_unified") {
        REQUIRE(side_of(kUnified, false) == "foo\nbaz\n");
        REQUIRE(side_of(kUnified, true) == "bar\nbaz\n");
    }

    SUBCASE("extract_no_newline") {
        std::string text = "@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file\n";
        REQUIRE(side_of(text, false) == "a");
        REQUIRE(side_of(text, true) == "b");
    }

    SUBCASE("extract_context") {
        REQUIRE(side_of(kContext, false) == "foo\nbaz\n");
        REQUIRE(side_of(kContext, true) == "bar\nbaz\n");

        std::string omitted =
            "***************\n"
            "*** 3 ****\n"
            "--- 3,4 ----\n"
            "+ new\n"
            "  ctx\n";
        REQUIRE(side_of(omitted, false) == "ctx\n");
        REQUIRE(side_of(omitted, true) == "new\nctx\n");
    }

    SUBCASE("extract_normal") {
        std::string text = "3c3\n< a\n---\n> b\n";
        REQUIRE(side_of(text, false) == "a\n");
        REQUIRE(side_of(text, true) == "b\n");
    }

    SUBCASE("extract_maps_point") {
        HunkParseOptions options;
        Span bounds{0, kUnified.size()};
        Pos in_bar = kUnified.find("+bar") + 2;

        HunkText result;
        Error error;
        REQUIRE(extract_hunk_text(kUnified, bounds, true, in_bar, options, result, error));
        REQUIRE(result.point == std::optional<std::size_t>{1});

        REQUIRE(extract_hunk_text(kUnified, bounds, false, in_bar, options, result, error));
        REQUIRE(!result.point.has_value());

        REQUIRE(extract_hunk_text(kUnified, bounds, false, Pos{3}, options, result, error));
        REQUIRE(!result.point.has_value());
    }
}

TEST_CASE("hunk_sanity_check") {
    HunkParseOptions options;
    auto yes = [](const std::string&) { return true; };
    auto no = [](const std::string&) { return false; };

    SUBCASE("consistent") {
        std::string text = kUnified;
        Error error;
        REQUIRE(sanity_check_hunk(text, 0, no, options, error));
        REQUIRE(text == kUnified);
    }

    SUBCASE("whitespace_loss_fixed") {
        options.valid_unified_empty_line = false;
        std::string text = "@@ -1,2 +1,2 @@\n-foo\n+bar\n\n";
        std::vector<std::string> questions;
        Error error;
        REQUIRE(sanity_check_hunk(
            text, 0,
            [&](const std::string& question) {
                questions.push_back(question);
                return true;
            },
            options, error));
        REQUIRE(text == "@@ -1,2 +1,2 @@\n-foo\n+bar\n \n");
        REQUIRE(questions.size() == 1);
        REQUIRE(questions[0] == "Try to auto-fix whitespace loss? ");
    }

    SUBCASE("declined_fix_aborts") {
        options.valid_unified_empty_line = false;
        std::string text = "@@ -1,2 +1,2 @@\n-foo\n+bar\n\n";
        Error error;
        REQUIRE(!sanity_check_hunk(text, 0, no, options, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);
        REQUIRE(error.message == "Abort!");
    }

    SUBCASE("word_wrap_joined") {
        std::string text = "@@ -1,2 +1,2 @@\n foo bar\nbaz\n qux\n";
        Error error;
        REQUIRE(sanity_check_hunk(text, 0, yes, options, error));
        REQUIRE(text == "@@ -1,2 +1,2 @@\n foo bar baz\n qux\n");
    }

    SUBCASE("counts_too_small") {
        std::string text = "@@ -1 +1 @@\n-a\n+b\n c\n";
        Error error;
        REQUIRE(!sanity_check_hunk(text, 0, yes, options, error));
        REQUIRE(error.message == "Hunk seriously messed up");
    }

    SUBCASE("end_ambiguous") {
        std::string text = "@@ -1 +1 @@\n-a\n+b\n-c\n@@ -5 +5 @@\n";
        Error error;
        REQUIRE(!sanity_check_hunk(text, 0, yes, options, error));
        REQUIRE(error.message == "End of hunk ambiguously marked");
    }

    SUBCASE("concatenated_patches_separated") {
        std::string text = "@@ -1 +1 @@\n-a\n+b\n--- x\n+++ x\n@@ -1 +1 @@\n-c\n+d\n";
        Error error;
        REQUIRE(sanity_check_hunk(text, 0, no, options, error));
        REQUIRE(text == "@@ -1 +1 @@\n-a\n+b\n\n--- x\n+++ x\n@@ -1 +1 @@\n-c\n+d\n");
    }

    SUBCASE("context_whitespace_loss") {
        std::string text =
            "***************\n"
            "*** 1,2 ****\n"
            "! foo\n"
            "\n"
            "--- 1,2 ----\n"
            "! bar\n"
            "  baz\n";
        Error error;
        REQUIRE(sanity_check_hunk(text, 0, yes, options, error));
        REQUIRE(text.find("! foo\n  \n--- 1,2 ----\n") != std::string::npos);
    }

    SUBCASE("context_missing_mid_header") {
        std::string text =
            "***************\n"
            "*** 1,2 ****\n"
            "! foo\n"
            "  baz\n"
            "! bar\n";
        Error error;
        REQUIRE(!sanity_check_hunk(text, 0, yes, options, error));
        REQUIRE(error.kind == ErrorKind::MalformedHunk);
    }
}
