#include "processing/text_analysis.hpp"

#include "processing/tokenizer.hpp"
#include "util/utf8.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string_view>
#include <tuple>
#include <unordered_map>

using namespace textdiff;

namespace {

const std::size_t kMaxKeyTerms = 10;

// clang-format off
const std::array<std::string_view, 45> kStopWords = {
    "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for", "of",
    "with", "by", "is", "are", "was", "were", "be", "been", "have", "has", "had",
    "do", "does", "did", "will", "would", "could", "should", "may", "might",
    "must", "can", "this", "that", "these", "those", "i", "you", "he", "she",
    "it", "we", "they",
};

const std::array<std::tuple<double, const char*>, 6> kReadabilityLevels {{
    { 90.0, "Very Easy" },
    { 80.0, "Easy" },
    { 70.0, "Fairly Easy" },
    { 60.0, "Standard" },
    { 50.0, "Fairly Difficult" },
    { 30.0, "Difficult" },
}};
// clang-format on

double
round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

bool
is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool
is_stop_word(const std::string& word) {
    return std::find(kStopWords.begin(), kStopWords.end(), word) != kStopWords.end();
}

// Every [A-Za-z0-9_] run, as written.
std::vector<std::string>
all_words(const std::string& text) {
    std::vector<std::string> words;
    std::string::size_type seeker = 0;
    while (seeker < text.size()) {
        if (!is_word_char(text[seeker])) {
            seeker++;
            continue;
        }
        auto start = seeker;
        while (seeker < text.size() && is_word_char(text[seeker])) {
            seeker++;
        }
        words.push_back(text.substr(start, seeker - start));
    }
    return words;
}

// Pieces between runs of '.', '!' and '?' that are not blank.
int64_t
count_sentences(const std::string& text) {
    int64_t count = 0;
    std::string piece;
    auto flush = [&]() {
        if (!is_empty(piece)) {
            count++;
        }
        piece.clear();
    };
    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            flush();
        } else {
            piece.push_back(c);
        }
    }
    flush();
    return count;
}

int64_t
count_non_whitespace(const std::string& text) {
    int64_t count = 0;
    std::string::size_type pos = 0;
    while (pos < text.size()) {
        auto next = utf8_advance_by(text, pos, 1);
        if (!is_whitespace(text[pos])) {
            count++;
        }
        pos = next;
    }
    return count;
}

std::vector<std::string>
rank_key_terms(const std::vector<std::string>& words) {
    // Frequency in order of first appearance; a stable sort keeps that
    // order among equal counts.
    std::vector<std::pair<std::string, int64_t>> frequencies;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& word : words) {
        if (word.size() <= 4) {
            continue;
        }
        auto lower = word;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (is_stop_word(lower)) {
            continue;
        }
        auto it = positions.find(lower);
        if (it == positions.end()) {
            positions.emplace(lower, frequencies.size());
            frequencies.push_back({lower, 1});
        } else {
            frequencies[it->second].second++;
        }
    }

    std::stable_sort(frequencies.begin(), frequencies.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second > rhs.second; });

    std::vector<std::string> terms;
    for (const auto& [term, _count] : frequencies) {
        if (terms.size() == kMaxKeyTerms) {
            break;
        }
        terms.push_back(term);
    }
    return terms;
}

}  // namespace

Readability
textdiff::readability_from(double words_per_sentence, double chars_per_word) {
    Readability readability;
    double score = 206.835 - (1.015 * words_per_sentence) - (84.6 * chars_per_word);
    readability.score = round2(score);
    readability.level = "Very Difficult";
    for (const auto& [floor, name] : kReadabilityLevels) {
        if (score >= floor) {
            readability.level = name;
            break;
        }
    }
    return readability;
}

TextAnalysis
textdiff::analyze_text(const std::string& text) {
    TextAnalysis analysis;

    auto words = all_words(text);
    analysis.word_count = static_cast<int64_t>(words.size());
    analysis.sentence_count = count_sentences(text);
    analysis.paragraph_count = static_cast<int64_t>(split_units(text, Granularity::Paragraph).size());

    double words_per_sentence = 0.0;
    if (analysis.sentence_count > 0) {
        words_per_sentence = static_cast<double>(analysis.word_count) / static_cast<double>(analysis.sentence_count);
    }
    double chars_per_word = 0.0;
    if (analysis.word_count > 0) {
        chars_per_word = static_cast<double>(count_non_whitespace(text)) / static_cast<double>(analysis.word_count);
    }

    analysis.average_words_per_sentence = round2(words_per_sentence);
    analysis.average_chars_per_word = round2(chars_per_word);
    analysis.readability = readability_from(words_per_sentence, chars_per_word);
    analysis.key_terms = rank_key_terms(words);

    return analysis;
}
