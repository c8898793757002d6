#include "util/hash.hpp"

#include <doctest.h>

#include <string>

using namespace patchy;

TEST_CASE("hash") {
    SUBCASE("known_value") {
        // CRC-32C check value for the ASCII digits 1..9.
        REQUIRE(hash::hash("123456789") == 0xE3069283u);
    }

    SUBCASE("overloads_agree") {
        std::string s = "foo\nbaz\n";
        REQUIRE(hash::hash(s.data(), s.size()) == hash::hash(s));
        REQUIRE(hash::hash("foo") != hash::hash("bar"));
    }
}
