#include "processing/insights.hpp"

#include "util/utf8.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

using namespace textdiff;

namespace {

const char* kExpansionNote = "Content expansion detected - verify new information is accurate";
const char* kReductionNote = "Content reduction detected - verify important information was not lost";
const char* kRewordingNote = "Extensive rewording detected - review for meaning preservation";
const char* kMajorChangeNote = "Major changes detected - comprehensive review recommended";

double
round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

int64_t
display_length(const ChangeRecord& change) {
    int64_t original = change.original_text ? utf8_len(*change.original_text) : 0;
    int64_t modified = change.modified_text ? utf8_len(*change.modified_text) : 0;
    return std::max(original, modified);
}

std::string
count_phrase(const char* verb, int64_t count) {
    return fmt::format("{} {} item{}. ", verb, count, count != 1 ? "s" : "");
}

}  // namespace

std::string
textdiff::to_string(Impact impact) {
    switch (impact) {
        case Impact::Low:
            return "low";
        case Impact::Medium:
            return "medium";
        case Impact::High:
            return "high";
    }
    return "low";
}

double
textdiff::change_ratio(const DiffResult& result) {
    const auto& stats = result.stats;
    if (result.changes.empty()) {
        return 0.0;
    }
    auto total_changes = stats.added + stats.removed + stats.modified;
    return static_cast<double>(total_changes) / static_cast<double>(result.changes.size());
}

Impact
textdiff::impact_from_ratio(double ratio) {
    if (ratio < 0.1) {
        return Impact::Low;
    } else if (ratio < 0.3) {
        return Impact::Medium;
    }
    return Impact::High;
}

DiffInsights
textdiff::compute_insights(const DiffResult& result) {
    const auto& stats = result.stats;
    const auto entries = static_cast<double>(result.changes.size());

    DiffInsights insights;
    insights.total_changes = stats.added + stats.removed + stats.modified;
    insights.change_distribution = stats;

    if (!result.changes.empty()) {
        insights.change_percentage = round2(static_cast<double>(insights.total_changes) / entries * 100.0);
        insights.similarity = round2(static_cast<double>(stats.unchanged) / entries * 100.0);
    }

    int64_t longest = 0;
    for (const auto& change : result.changes) {
        if (change.kind == ChangeKind::Unchanged) {
            continue;
        }
        auto length = display_length(change);
        if (length > longest) {
            longest = length;
            insights.largest_change = change;
        }
    }

    return insights;
}

ChangeSummary
textdiff::summarize_changes(const DiffResult& result) {
    const auto& stats = result.stats;
    const auto ratio = change_ratio(result);

    ChangeSummary summary;
    summary.change_types = stats;
    summary.impact = impact_from_ratio(ratio);

    std::string text;
    if (stats.added > 0) {
        text += count_phrase("Added", stats.added);
    }
    if (stats.removed > 0) {
        text += count_phrase("Removed", stats.removed);
    }
    if (stats.modified > 0) {
        text += count_phrase("Modified", stats.modified);
    }
    if (stats.unchanged > 0) {
        text += fmt::format("{} item{} unchanged.", stats.unchanged, stats.unchanged != 1 ? "s" : "");
    }
    while (!text.empty() && text.back() == ' ') {
        text.pop_back();
    }
    summary.summary = text.empty() ? "No changes detected" : text;

    if (stats.added > stats.removed * 2) {
        summary.recommendations.push_back(kExpansionNote);
    }
    if (stats.removed > stats.added * 2) {
        summary.recommendations.push_back(kReductionNote);
    }
    if (stats.modified > stats.added + stats.removed) {
        summary.recommendations.push_back(kRewordingNote);
    }
    if (ratio > 0.5) {
        summary.recommendations.push_back(kMajorChangeNote);
    }

    return summary;
}

std::optional<std::size_t>
textdiff::find_next_change(const std::vector<ChangeRecord>& changes, int64_t current) {
    for (auto i = std::max<int64_t>(current + 1, 0); i < static_cast<int64_t>(changes.size()); i++) {
        if (changes[static_cast<std::size_t>(i)].kind != ChangeKind::Unchanged) {
            return static_cast<std::size_t>(i);
        }
    }
    return std::nullopt;
}

std::optional<std::size_t>
textdiff::find_previous_change(const std::vector<ChangeRecord>& changes, int64_t current) {
    auto start = std::min<int64_t>(current, static_cast<int64_t>(changes.size())) - 1;
    for (auto i = start; i >= 0; i--) {
        if (changes[static_cast<std::size_t>(i)].kind != ChangeKind::Unchanged) {
            return static_cast<std::size_t>(i);
        }
    }
    return std::nullopt;
}

std::vector<std::size_t>
textdiff::all_change_indices(const std::vector<ChangeRecord>& changes) {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < changes.size(); i++) {
        if (changes[i].kind != ChangeKind::Unchanged) {
            indices.push_back(i);
        }
    }
    return indices;
}
