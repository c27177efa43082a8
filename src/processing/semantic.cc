#include "processing/semantic.hpp"

#include "util/utf8.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

using namespace textdiff;

namespace {

bool
is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Key words of `from` that are missing in `other`.
std::vector<std::string>
missing_words(const std::vector<std::string>& from, const std::vector<std::string>& other) {
    std::unordered_set<std::string> other_set(other.begin(), other.end());
    std::vector<std::string> result;
    for (const auto& word : from) {
        if (result.size() == kMaxKeyWords) {
            break;
        }
        if (word.size() >= kKeyWordMinLength && other_set.find(word) == other_set.end()) {
            result.push_back(word);
        }
    }
    return result;
}

}  // namespace

std::vector<std::string>
textdiff::extract_words(const std::string& text) {
    std::vector<std::string> words;
    std::unordered_set<std::string> seen;

    std::string::size_type seeker = 0;
    while (seeker < text.size()) {
        if (!is_word_char(text[seeker])) {
            seeker++;
            continue;
        }
        std::string word;
        while (seeker < text.size() && is_word_char(text[seeker])) {
            word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[seeker]))));
            seeker++;
        }
        if (seen.insert(word).second) {
            words.push_back(std::move(word));
        }
    }
    return words;
}

double
textdiff::compute_similarity(const std::string& original, const std::string& modified) {
    auto words_a = extract_words(original);
    auto words_b = extract_words(modified);

    if (words_a.empty() && words_b.empty()) {
        return 1.0;
    }
    if (words_a.empty() || words_b.empty()) {
        return 0.0;
    }

    std::unordered_set<std::string> set_a(words_a.begin(), words_a.end());
    std::size_t intersection = 0;
    for (const auto& word : words_b) {
        if (set_a.find(word) != set_a.end()) {
            intersection++;
        }
    }
    const auto union_size = words_a.size() + words_b.size() - intersection;
    const double jaccard = static_cast<double>(intersection) / static_cast<double>(union_size);

    // Both texts contain a word, so neither length is zero.
    const auto len_a = utf8_len(original);
    const auto len_b = utf8_len(modified);
    const double length_ratio =
        static_cast<double>(std::min(len_a, len_b)) / static_cast<double>(std::max(len_a, len_b));

    return jaccard * 0.7 + length_ratio * 0.3;
}

KeyWords
textdiff::extract_key_words(const std::string& original, const std::string& modified) {
    auto words_a = extract_words(original);
    auto words_b = extract_words(modified);
    return {missing_words(words_b, words_a), missing_words(words_a, words_b)};
}

std::string
textdiff::explain_change(double similarity, const KeyWords& key_words, double similarity_threshold) {
    if (similarity > similarity_threshold) {
        std::string explanation =
            fmt::format("Reworded with {}% similarity.", std::lround(similarity * 100.0));
        std::vector<std::string> details;
        if (!key_words.added.empty()) {
            details.push_back(fmt::format("added \"{}\"", key_words.added.front()));
        }
        if (!key_words.removed.empty()) {
            details.push_back(fmt::format("removed \"{}\"", key_words.removed.front()));
        }
        if (!details.empty()) {
            explanation += fmt::format(" Key changes: {}", fmt::join(details, ", "));
        }
        return explanation;
    }

    if (key_words.added.empty()) {
        return "Significantly modified.";
    }
    auto count = std::min<std::size_t>(2, key_words.added.size());
    std::vector<std::string> focus(key_words.added.begin(), key_words.added.begin() + count);
    return fmt::format("Significantly modified. New focus: {}", fmt::join(focus, ", "));
}

SemanticAnalysis
textdiff::analyze_change(const std::string& original, const std::string& modified, double similarity_threshold) {
    SemanticAnalysis analysis;
    analysis.similarity = compute_similarity(original, modified);
    analysis.key_words = extract_key_words(original, modified);
    analysis.explanation = explain_change(analysis.similarity, analysis.key_words, similarity_threshold);
    return analysis;
}
