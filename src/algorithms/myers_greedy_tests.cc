#include "algorithms/myers_greedy.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace patchy;

namespace {

std::string
render(const std::vector<Edit>& edits, const std::string& a, const std::string& b) {
    std::string out;
    for (const auto& e : edits) {
        switch (e.type) {
            case EditType::Common:
                out += a[static_cast<size_t>(e.a_index)];
                break;
            case EditType::Delete:
                out += '-';
                out += a[static_cast<size_t>(e.a_index)];
                break;
            case EditType::Insert:
                out += '+';
                out += b[static_cast<size_t>(e.b_index)];
                break;
        }
    }
    return out;
}

}  // namespace

TEST_CASE("myers_greedy") {
    SUBCASE("classic") {
        std::string a = "abcabba";
        std::string b = "cbabac";
        DiffInput<char> input{{a.data(), a.size()}, {b.data(), b.size()}};
        auto result = MyersGreedy<char>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);

        size_t deletes = 0, inserts = 0, common = 0;
        for (const auto& e : result.edit_sequence) {
            deletes += e.type == EditType::Delete;
            inserts += e.type == EditType::Insert;
            common += e.type == EditType::Common;
        }
        // Edit distance 5, LCS length 4.
        REQUIRE(deletes + inserts == 5);
        REQUIRE(common == 4);
    }

    SUBCASE("equal") {
        std::string a = "same";
        DiffInput<char> input{{a.data(), a.size()}, {a.data(), a.size()}};
        auto result = MyersGreedy<char>(input).compute();
        REQUIRE(result.status == DiffResultStatus::NoChanges);
        REQUIRE(result.edit_sequence.size() == 4);
    }

    SUBCASE("one_side_empty") {
        std::string a = "ab";
        std::string b;
        DiffInput<char> input{{a.data(), a.size()}, {b.data(), b.size()}};
        auto result = MyersGreedy<char>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);
        REQUIRE(render(result.edit_sequence, a, b) == "-a-b");
    }

    SUBCASE("forward_order") {
        std::string a = "foo";
        std::string b = "fxo";
        DiffInput<char> input{{a.data(), a.size()}, {b.data(), b.size()}};
        auto result = MyersGreedy<char>(input).compute();
        REQUIRE(result.status == DiffResultStatus::OK);
        auto s = render(result.edit_sequence, a, b);
        REQUIRE(s.front() == 'f');
        REQUIRE(s.back() == 'o');
        REQUIRE(s.size() == 6);
    }
}
