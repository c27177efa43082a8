#include "tokenizer.hpp"

#include "processing/normalizer.hpp"
#include "util/hash.hpp"
#include "util/utf8.hpp"

#include <string>
#include <vector>

using namespace textdiff;

namespace {

bool
is_terminal_punctuation(char c) {
    return c == '.' || c == '!' || c == '?';
}

// '\n' and '\r\n' both end a line. A text ending in a line break has an
// empty last line.
std::vector<std::string>
split_lines(const std::string& text) {
    std::vector<std::string> result;
    std::string::size_type start = 0;
    while (true) {
        auto lf = text.find('\n', start);
        if (lf == std::string::npos) {
            result.push_back(text.substr(start));
            break;
        }
        auto end = lf;
        if (end > start && text[end - 1] == '\r') {
            end--;
        }
        result.push_back(text.substr(start, end - start));
        start = lf + 1;
    }
    return result;
}

std::vector<std::string>
split_words(const std::string& text) {
    std::vector<std::string> result;
    std::string::size_type seeker = 0;
    while (seeker < text.size()) {
        while (seeker < text.size() && is_whitespace(text[seeker])) {
            seeker++;
        }
        auto start = seeker;
        while (seeker < text.size() && !is_whitespace(text[seeker])) {
            seeker++;
        }
        if (seeker > start) {
            result.push_back(text.substr(start, seeker - start));
        }
    }
    return result;
}

// A sentence ends with a run of '.', '!' or '?' that is followed by
// whitespace. That run and the whitespace after it form a token of their
// own, so a changed terminator does not change the sentence before it.
// Blank pieces are dropped.
std::vector<std::string>
split_sentences(const std::string& text) {
    std::vector<std::string> result;
    std::string::size_type start = 0;
    std::string::size_type seeker = 0;

    auto push = [&](std::string::size_type from, std::string::size_type to) {
        auto piece = text.substr(from, to - from);
        if (!is_empty(piece)) {
            result.push_back(std::move(piece));
        }
    };

    while (seeker < text.size()) {
        if (!is_terminal_punctuation(text[seeker])) {
            seeker++;
            continue;
        }
        auto terminator = seeker;
        while (seeker < text.size() && is_terminal_punctuation(text[seeker])) {
            seeker++;
        }
        if (seeker < text.size() && is_whitespace(text[seeker])) {
            while (seeker < text.size() && is_whitespace(text[seeker])) {
                seeker++;
            }
            push(start, terminator);
            push(terminator, seeker);
            start = seeker;
        }
    }
    if (start < text.size()) {
        push(start, text.size());
    }
    return result;
}

// Paragraphs are separated by a line break, optional whitespace and
// another line break. The separator extends to the last line break in the
// whitespace run.
std::vector<std::string>
split_paragraphs(const std::string& text) {
    std::vector<std::string> result;
    std::string::size_type start = 0;
    std::string::size_type seeker = 0;

    auto push = [&](std::string::size_type end) {
        auto paragraph = text.substr(start, end - start);
        if (!is_empty(paragraph)) {
            result.push_back(std::move(paragraph));
        }
    };

    while (seeker < text.size()) {
        if (text[seeker] != '\n') {
            seeker++;
            continue;
        }
        auto run_end = seeker + 1;
        auto last_lf = std::string::npos;
        while (run_end < text.size() && is_whitespace(text[run_end])) {
            if (text[run_end] == '\n') {
                last_lf = run_end;
            }
            run_end++;
        }
        if (last_lf == std::string::npos) {
            seeker++;
            continue;
        }
        push(seeker);
        start = last_lf + 1;
        seeker = start;
    }
    if (start < text.size()) {
        push(text.size());
    }
    return result;
}

}  // namespace

bool
textdiff::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (const auto whitespace : whitespaces) {
        if (whitespace != '\0' && whitespace == c) {
            return true;
        }
    }
    return false;
}

bool
textdiff::is_empty(const std::string& s) {
    for (char c : s) {
        if (!textdiff::is_whitespace(c)) {
            return false;
        }
    }
    return true;
}

std::vector<std::string>
textdiff::split_units(const std::string& text, Granularity granularity) {
    // Nothing to do.
    if (text.empty()) {
        return {};
    }

    switch (granularity) {
        case Granularity::Character:
            return utf8_split(text);
        case Granularity::Word:
            return split_words(text);
        case Granularity::Line:
            return split_lines(text);
        case Granularity::Sentence:
            return split_sentences(text);
        case Granularity::Paragraph:
            return split_paragraphs(text);
    }
    return {text};
}

std::vector<Token>
textdiff::tokenize(const std::string& text, const DiffOptions& options) {
    auto units = split_units(text, options.granularity);

    std::vector<Token> result;
    result.reserve(units.size());
    for (auto& unit : units) {
        auto normalized = normalize(unit, options);
        auto checksum = hash::hash(normalized);
        result.push_back({std::move(unit), std::move(normalized), checksum});
    }
    return result;
}
