#include "text_format.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <vector>

using namespace textdiff;

namespace {

void
append_statistics(const ChangeStats& stats, std::vector<std::string>& output) {
    output.push_back("");
    output.push_back("Statistics:");
    output.push_back(fmt::format("  Added:    {}", stats.added));
    output.push_back(fmt::format("  Removed:  {}", stats.removed));
    output.push_back(fmt::format("  Modified: {}", stats.modified));
    output.push_back(fmt::format("  Unchanged: {}", stats.unchanged));
}

void
append_explanation(const ChangeRecord& change, const std::string& prefix, std::vector<std::string>& output) {
    if (change.kind == ChangeKind::Modified && change.explanation) {
        output.push_back(fmt::format("{}    {}", prefix, *change.explanation));
    }
}

std::string
line_number(const std::optional<int64_t>& n) {
    return n ? fmt::format("{:>4}", *n) : std::string(4, ' ');
}

}  // namespace

std::string
textdiff::format_text(const DiffResult& result) {
    std::vector<std::string> output;

    for (const auto& change : result.changes) {
        const auto original = change.original_text.value_or("");
        const auto modified = change.modified_text.value_or("");

        switch (change.kind) {
            case ChangeKind::Added:
                output.push_back(fmt::format("+ {}", modified));
                break;
            case ChangeKind::Removed:
                output.push_back(fmt::format("- {}", original));
                break;
            case ChangeKind::Modified:
                output.push_back(fmt::format("~ {} -> {}", original, modified));
                break;
            case ChangeKind::Unchanged:
                output.push_back(fmt::format("  {}", original));
                break;
        }
        append_explanation(change, "", output);
    }

    append_statistics(result.stats, output);
    return fmt::format("{}", fmt::join(output, "\n"));
}

std::string
textdiff::format_text_colored(const DiffResult& result, const ColorScheme& colors) {
    std::vector<std::string> output;

    for (const auto& change : result.changes) {
        const auto original = change.original_text.value_or("");
        const auto modified = change.modified_text.value_or("");

        std::string prefix;
        if (change.original_line || change.modified_line) {
            prefix = fmt::format("{} {} ", line_number(change.original_line), line_number(change.modified_line));
        }

        switch (change.kind) {
            case ChangeKind::Added:
                output.push_back(fmt::format("{}{} {}", prefix, colorize(colors.added, "+"),
                                             colorize(colors.added, modified)));
                break;
            case ChangeKind::Removed:
                output.push_back(fmt::format("{}{} {}", prefix, colorize(colors.removed, "-"),
                                             colorize(colors.removed, original)));
                break;
            case ChangeKind::Modified:
                output.push_back(fmt::format("{}{} {} {} {}", prefix, colorize(colors.modified, "~"),
                                             colorize(colors.removed, original), colorize(colors.context, "->"),
                                             colorize(colors.added, modified)));
                break;
            case ChangeKind::Unchanged:
                output.push_back(fmt::format("{}{} {}", prefix, colorize(colors.context, " "), original));
                break;
        }
        append_explanation(change, prefix.empty() ? "" : std::string(prefix.size(), ' '), output);
    }

    append_statistics(result.stats, output);
    return fmt::format("{}", fmt::join(output, "\n"));
}

std::string
textdiff::format_insights(const DiffInsights& insights, const ChangeSummary& summary) {
    std::vector<std::string> output;
    output.push_back("Summary:");
    output.push_back(fmt::format("  {}", summary.summary));
    output.push_back(fmt::format("  Impact:     {}", to_string(summary.impact)));
    output.push_back(fmt::format("  Changes:    {} ({}%)", insights.total_changes, insights.change_percentage));
    output.push_back(fmt::format("  Similarity: {}%", insights.similarity));

    if (!summary.recommendations.empty()) {
        output.push_back("Recommendations:");
        for (const auto& recommendation : summary.recommendations) {
            output.push_back(fmt::format("  - {}", recommendation));
        }
    }
    return fmt::format("{}", fmt::join(output, "\n"));
}
