#include "processing/semantic.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace textdiff;

using Words = std::vector<std::string>;

TEST_CASE("semantic") {
    SUBCASE("extract_words") {
        REQUIRE(extract_words("The cat, the HAT_2!") == Words{"the", "cat", "hat_2"});
        REQUIRE(extract_words("... !!").empty());
    }

    SUBCASE("similarity_bounds") {
        REQUIRE(compute_similarity("", "") == doctest::Approx(1.0));
        REQUIRE(compute_similarity("--", "??") == doctest::Approx(1.0));
        REQUIRE(compute_similarity("words", "") == doctest::Approx(0.0));
        REQUIRE(compute_similarity("", "words") == doctest::Approx(0.0));
        REQUIRE(compute_similarity("same text", "same text") == doctest::Approx(1.0));
    }

    SUBCASE("similarity_weights") {
        // jaccard 2/4, length ratio 12/13
        auto similarity = compute_similarity("The quick fox", "The fast fox");
        REQUIRE(similarity == doctest::Approx(0.7 * 0.5 + 0.3 * 12.0 / 13.0));

        // Disjoint words still score on length.
        REQUIRE(compute_similarity("abc", "xyz") == doctest::Approx(0.3));
    }

    SUBCASE("key_words") {
        auto key_words = extract_key_words("The quick fox", "The fast fox");
        REQUIRE(key_words.added == Words{"fast"});
        REQUIRE(key_words.removed == Words{"quick"});

        // Short words are ignored.
        key_words = extract_key_words("a cat", "a dog");
        REQUIRE(key_words.added.empty());
        REQUIRE(key_words.removed.empty());
    }

    SUBCASE("key_words_capped") {
        auto key_words = extract_key_words("", "alpha bravo charlie delta echo foxtrot golf hotel");
        REQUIRE(key_words.added == Words{"alpha", "bravo", "charlie", "delta", "echo"});
        REQUIRE(key_words.removed.empty());
    }

    SUBCASE("explanation_reworded") {
        auto analysis = analyze_change("The quick fox", "The fast fox", 0.5);
        REQUIRE(analysis.similarity > 0.5);
        REQUIRE(analysis.explanation == "Reworded with 63% similarity. Key changes: added \"fast\", removed \"quick\"");

        KeyWords none;
        REQUIRE(explain_change(0.9, none, 0.5) == "Reworded with 90% similarity.");
    }

    SUBCASE("explanation_significant") {
        auto analysis = analyze_change("The quick fox", "The fast fox", 0.9);
        REQUIRE(analysis.explanation == "Significantly modified. New focus: fast");

        KeyWords key_words{{"first", "second", "third"}, {"gone"}};
        REQUIRE(explain_change(0.2, key_words, 0.5) == "Significantly modified. New focus: first, second");
        REQUIRE(explain_change(0.2, KeyWords{}, 0.5) == "Significantly modified.");
    }

    SUBCASE("threshold_is_exclusive") {
        KeyWords none;
        REQUIRE(explain_change(0.5, none, 0.5) == "Significantly modified.");
        REQUIRE(explain_change(0.1, none, 0.0) == "Reworded with 10% similarity.");
    }
}
