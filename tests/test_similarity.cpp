#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "termcode-patch/Similarity.h"

using namespace termcode_patch;
using Catch::Matchers::WithinAbs;

TEST_CASE("editDistance - classic cases", "[similarity]") {
    CHECK(editDistance("", "") == 0);
    CHECK(editDistance("abc", "") == 3);
    CHECK(editDistance("", "abc") == 3);
    CHECK(editDistance("kitten", "sitting") == 3);
    CHECK(editDistance("sitting", "kitten") == 3);
    CHECK(editDistance("flaw", "lawn") == 2);
    CHECK(editDistance("same", "same") == 0);
}

TEST_CASE("similarity - normalized score", "[similarity]") {
    SECTION("identical and empty") {
        CHECK(similarity("", "") == 1.0);
        CHECK(similarity("abc", "abc") == 1.0);
    }

    SECTION("completely different") {
        CHECK(similarity("abc", "xyz") == 0.0);
        CHECK(similarity("abc", "") == 0.0);
    }

    SECTION("one substitution in five") {
        CHECK_THAT(similarity("abcde", "abcdx"), WithinAbs(0.8, 1e-12));
    }

    SECTION("length difference") {
        // "int x;" -> "int xy;" is one insertion over seven characters
        CHECK_THAT(similarity("int x;", "int xy;"), WithinAbs(1.0 - 1.0 / 7.0, 1e-12));
    }
}

TEST_CASE("meetsThreshold - boundary", "[similarity]") {
    CHECK(meetsThreshold(similarity("abcde", "abcdx"), 0.8));
    CHECK(meetsThreshold(0.8, 0.8));
    CHECK_FALSE(meetsThreshold(0.79, 0.8));
    CHECK(meetsThreshold(0.0, 0.0));
    CHECK_FALSE(meetsThreshold(0.99, 1.0));
}
