#include "processing/normalizer.hpp"

#include "processing/tokenizer.hpp"

#include <cctype>

using namespace textdiff;

std::string
textdiff::collapse_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (is_whitespace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(c);
    }
    return result;
}

std::string
textdiff::to_lower(const std::string& text) {
    std::string result = text;
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string
textdiff::normalize(const std::string& text, const DiffOptions& options) {
    std::string normalized = text;
    if (options.ignore_whitespace) {
        normalized = collapse_whitespace(normalized);
    }
    if (options.ignore_case) {
        normalized = to_lower(normalized);
    }
    return normalized;
}
