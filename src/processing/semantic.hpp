#pragma once

/*
    Lexical similarity for a pair of differing text spans.

    This is word overlap plus a length ratio, not language understanding:

        similarity = 0.7 * jaccard(words(a), words(b))
                   + 0.3 * min(len(a), len(b)) / max(len(a), len(b))

    Words are runs of [A-Za-z0-9_], lower-cased. Two spans without any
    words score 1.0; one side without words scores 0.0.
*/

#include "processing/change.hpp"

#include <string>
#include <vector>

namespace textdiff {

// At most this many key words are reported per side.
const std::size_t kMaxKeyWords = 5;

// Key words have at least this many characters.
const std::size_t kKeyWordMinLength = 4;

struct SemanticAnalysis {
    double similarity = 0.0;
    KeyWords key_words;
    std::string explanation;
};

// Distinct lower-cased words in order of first appearance.
std::vector<std::string>
extract_words(const std::string& text);

double
compute_similarity(const std::string& original, const std::string& modified);

KeyWords
extract_key_words(const std::string& original, const std::string& modified);

// Above the threshold the change reads as a rewording naming the first
// added and removed key word; otherwise as a significant modification
// naming up to two added key words.
std::string
explain_change(double similarity, const KeyWords& key_words, double similarity_threshold);

SemanticAnalysis
analyze_change(const std::string& original, const std::string& modified, double similarity_threshold);

}  // namespace textdiff
