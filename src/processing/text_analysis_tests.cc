#include "processing/text_analysis.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace textdiff;

TEST_CASE("text_analysis") {
    SUBCASE("empty") {
        auto analysis = analyze_text("");
        REQUIRE(analysis.word_count == 0);
        REQUIRE(analysis.sentence_count == 0);
        REQUIRE(analysis.paragraph_count == 0);
        REQUIRE(analysis.average_words_per_sentence == doctest::Approx(0.0));
        REQUIRE(analysis.average_chars_per_word == doctest::Approx(0.0));
        REQUIRE(analysis.readability.level == "Very Easy");
        REQUIRE(analysis.key_terms.empty());
    }

    SUBCASE("counts") {
        auto analysis = analyze_text("The cat sat. The dog ran!\n\nAnother paragraph here.");
        REQUIRE(analysis.word_count == 9);
        REQUIRE(analysis.sentence_count == 3);
        REQUIRE(analysis.paragraph_count == 2);
        REQUIRE(analysis.average_words_per_sentence == doctest::Approx(3.0));
        REQUIRE(analysis.average_chars_per_word == doctest::Approx(4.56));
        REQUIRE(analysis.key_terms == std::vector<std::string>{"another", "paragraph"});
    }

    SUBCASE("key_terms_by_frequency") {
        auto analysis = analyze_text("Rivers flow. Mountains stand. RIVERS bend; rivers would rise.");
        // "would" is a stop word; ties keep their first appearance.
        REQUIRE(analysis.key_terms == std::vector<std::string>{"rivers", "mountains", "stand"});
    }

    SUBCASE("readability_levels") {
        REQUIRE(readability_from(0.0, 0.0).level == "Very Easy");
        REQUIRE(readability_from(0.0, 0.0).score == doctest::Approx(206.84));
        REQUIRE(readability_from(10.0, 1.5).level == "Standard");
        REQUIRE(readability_from(15.0, 1.7).level == "Difficult");
        REQUIRE(readability_from(20.0, 4.0).level == "Very Difficult");
    }
}
