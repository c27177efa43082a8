#pragma once

/*
    Split a text into the units we compare: code points, words, lines,
    sentences or paragraphs.

    Each Token keeps the text as written (used for display) and its
    normalized form (used for comparison). The checksum of the normalized
    form makes most mismatches a single integer compare.
*/

#include "processing/options.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace textdiff {

struct Token {
    std::string text;
    std::string normalized;
    uint32_t checksum = 0;

    uint32_t
    hash() const {
        return checksum;
    }

    bool
    operator==(const Token& other) const {
        return checksum == other.checksum && normalized == other.normalized;
    }

    bool
    operator!=(const Token& other) const {
        return !(*this == other);
    }
};

bool
is_whitespace(char c);

bool
is_empty(const std::string& s);

// Split the text into unit strings. An empty text has no units.
std::vector<std::string>
split_units(const std::string& text, Granularity granularity);

// Split and normalize.
std::vector<Token>
tokenize(const std::string& text, const DiffOptions& options);

}  // namespace textdiff
