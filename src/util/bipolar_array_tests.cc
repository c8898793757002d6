#include "util/bipolar_array.hpp"

#include <doctest.h>

using namespace patchy;

TEST_CASE("bipolar_array") {
    SUBCASE("negative_indices") {
        BipolarArray<int> a{-3, 3};
        REQUIRE(a.size() == 7);
        for (int i = -3; i <= 3; i++) {
            a[i] = i * 10;
        }
        CHECK(a[-3] == -30);
        CHECK(a[0] == 0);
        CHECK(a[3] == 30);
    }

    SUBCASE("copy_is_independent") {
        BipolarArray<uint16_t> a{-1, 1};
        a[-1] = 1;
        a[0] = 2;
        a[1] = 3;

        BipolarArray<uint16_t> b{a};
        b[0] = 9;

        REQUIRE(a[0] == 2);
        REQUIRE(b[-1] == 1);
        REQUIRE(b[0] == 9);
        REQUIRE(b[1] == 3);
    }
}
