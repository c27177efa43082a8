#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace textdiff {

struct Readability {
    double score = 0.0;
    std::string level;
};

struct TextAnalysis {
    int64_t word_count = 0;
    int64_t sentence_count = 0;
    int64_t paragraph_count = 0;
    double average_words_per_sentence = 0.0;
    double average_chars_per_word = 0.0;
    Readability readability;

    // Most frequent words longer than four characters, stop words excluded.
    std::vector<std::string> key_terms;
};

// Flesch-like score: 206.835 - 1.015 * words/sentence - 84.6 * chars/word.
Readability
readability_from(double words_per_sentence, double chars_per_word);

TextAnalysis
analyze_text(const std::string& text);

}  // namespace textdiff
