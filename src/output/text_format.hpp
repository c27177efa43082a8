#pragma once

#include "config/config.hpp"
#include "processing/change.hpp"
#include "processing/insights.hpp"

#include <string>

namespace textdiff {

// One line per change followed by a statistics block:
//
//     + added
//     - removed
//     ~ before -> after
//       unchanged
//
// Explanations of modified entries are printed on an indented line below.
std::string
format_text(const DiffResult& result);

// As format_text, but with colors and, when the entries carry line
// numbers, a "%4d %4d " prefix with the original and modified line.
std::string
format_text_colored(const DiffResult& result, const ColorScheme& colors);

std::string
format_insights(const DiffInsights& insights, const ChangeSummary& summary);

}  // namespace textdiff
