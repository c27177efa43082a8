#include "processing/normalizer.hpp"

#include <doctest.h>

using namespace textdiff;

TEST_CASE("normalizer") {
    DiffOptions options;

    SUBCASE("untouched_by_default") {
        REQUIRE(normalize("  Hello\t World ", options) == "  Hello\t World ");
    }

    SUBCASE("ignore_whitespace") {
        options.ignore_whitespace = true;
        REQUIRE(normalize("  Hello\t \n World ", options) == "Hello World");
        REQUIRE(normalize(" \t ", options) == "");
        REQUIRE(normalize("", options) == "");
    }

    SUBCASE("ignore_case") {
        options.ignore_case = true;
        REQUIRE(normalize("Hello WORLD", options) == "hello world");
        // Only ascii is folded.
        REQUIRE(normalize("ÖL", options) == "Öl");
    }

    SUBCASE("both") {
        options.ignore_case = true;
        options.ignore_whitespace = true;
        REQUIRE(normalize(" The  Quick\tFox ", options) == "the quick fox");
    }
}
