#include "processing/merge.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace textdiff;

std::string
textdiff::generate_merged_text(const std::vector<ChangeRecord>& changes,
                               const MergeDecisions& decisions,
                               const std::string& separator) {
    std::vector<std::string> lines;
    lines.reserve(changes.size());

    for (std::size_t index = 0; index < changes.size(); index++) {
        const auto& change = changes[index];
        auto it = decisions.find(index);
        auto decision = it != decisions.end() ? it->second : MergeDecision::Keep;

        const auto original = change.original_text.value_or("");
        const auto modified = change.modified_text.value_or("");

        switch (change.kind) {
            case ChangeKind::Added:
                if (decision != MergeDecision::Reject) {
                    lines.push_back(modified);
                }
                break;
            case ChangeKind::Removed:
                if (decision != MergeDecision::Accept) {
                    lines.push_back(original);
                }
                break;
            case ChangeKind::Modified:
                lines.push_back(decision == MergeDecision::Reject ? original : modified);
                break;
            case ChangeKind::Unchanged:
                lines.push_back(original);
                break;
        }
    }

    return fmt::format("{}", fmt::join(lines, separator));
}
