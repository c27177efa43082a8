#include "util/utf8.hpp"

#include <doctest.h>

using namespace textdiff;

TEST_CASE("unicode") {
    SUBCASE("len") {
        std::string s = "öl och bål";
        REQUIRE(utf8_len(s) == 10);
        REQUIRE(utf8_len(s, 0, s.size()) == 10);
        REQUIRE(utf8_len(s, 0, 2) == 1);
    }

    SUBCASE("offset") {
        std::string s = "öl och bål";
        auto offset = utf8_advance_by(s, 0, 9);
        REQUIRE(offset == 11);
        REQUIRE(s.substr(offset, 1) == "l");
        REQUIRE(utf8_advance_by(s, 0, 100) == s.size());
    }

    SUBCASE("split") {
        auto parts = utf8_split("aö€");
        REQUIRE(parts.size() == 3);
        REQUIRE(parts[0] == "a");
        REQUIRE(parts[1] == "ö");
        REQUIRE(parts[2] == "€");
    }

    SUBCASE("truncated") {
        // Lead byte of a 3 byte sequence followed by ascii.
        std::string s = "\xE2" "ab";
        REQUIRE(utf8_len(s) == 3);
        REQUIRE(utf8_split(s).size() == 3);
    }

    SUBCASE("empty") {
        REQUIRE(utf8_len("") == 0);
        REQUIRE(utf8_split("").empty());
    }
}
