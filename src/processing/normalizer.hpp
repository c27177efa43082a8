#pragma once

#include "processing/options.hpp"

#include <string>

namespace textdiff {

// Comparison form of a token. With ignore_whitespace every whitespace run
// becomes a single space and the ends are trimmed; with ignore_case ASCII
// letters are lower-cased. The original text is kept for display.
std::string
normalize(const std::string& text, const DiffOptions& options);

std::string
collapse_whitespace(const std::string& text);

std::string
to_lower(const std::string& text);

}  // namespace textdiff
