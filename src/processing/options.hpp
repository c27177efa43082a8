#pragma once

#include <optional>
#include <string>

namespace textdiff {

enum class Granularity {
    Character,
    Word,
    Line,
    Sentence,
    Paragraph,
};

// Names accepted: "character", "word", "line", "sentence", "paragraph".
std::optional<Granularity>
granularity_from_string(const std::string& s);

std::string
to_string(Granularity granularity);

struct DiffOptions {
    Granularity granularity = Granularity::Line;
    bool ignore_whitespace = false;
    bool ignore_case = false;

    // Score and explain modified pairs.
    bool semantic_analysis = false;

    // Only picks the explanation wording; never hides a change.
    double similarity_threshold = 0.5;
};

}  // namespace textdiff
