#pragma once

/*
    Aggregate views over a finished DiffResult: counts and percentages,
    a coarse impact rating, review recommendations, and navigation between
    the entries that are not unchanged.
*/

#include "processing/change.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textdiff {

enum class Impact {
    Low,
    Medium,
    High,
};

std::string
to_string(Impact impact);

struct DiffInsights {
    int64_t total_changes = 0;

    // Percentages in [0, 100], rounded to two decimals.
    double change_percentage = 0.0;
    double similarity = 100.0;

    // The added, removed or modified entry with the longest text.
    std::optional<ChangeRecord> largest_change;

    ChangeStats change_distribution;
};

struct ChangeSummary {
    std::string summary;
    ChangeStats change_types;
    Impact impact = Impact::Low;
    std::vector<std::string> recommendations;
};

// Ratio of added, removed and modified entries to all entries; 0 when empty.
double
change_ratio(const DiffResult& result);

Impact
impact_from_ratio(double ratio);

DiffInsights
compute_insights(const DiffResult& result);

ChangeSummary
summarize_changes(const DiffResult& result);

// Index of the first entry after `current` that is not unchanged. Pass -1
// to search from the start.
std::optional<std::size_t>
find_next_change(const std::vector<ChangeRecord>& changes, int64_t current);

// Index of the last entry before `current` that is not unchanged.
std::optional<std::size_t>
find_previous_change(const std::vector<ChangeRecord>& changes, int64_t current);

std::vector<std::size_t>
all_change_indices(const std::vector<ChangeRecord>& changes);

}  // namespace textdiff
