#include "processing/change.hpp"

using namespace textdiff;

std::string
textdiff::to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Unchanged:
            return "unchanged";
        case ChangeKind::Added:
            return "added";
        case ChangeKind::Removed:
            return "removed";
        case ChangeKind::Modified:
            return "modified";
    }
    return "unchanged";
}

ChangeStats
textdiff::count_changes(const std::vector<ChangeRecord>& changes) {
    ChangeStats stats;
    for (const auto& change : changes) {
        switch (change.kind) {
            case ChangeKind::Added:
                stats.added++;
                break;
            case ChangeKind::Removed:
                stats.removed++;
                break;
            case ChangeKind::Modified:
                stats.modified++;
                break;
            case ChangeKind::Unchanged:
                stats.unchanged++;
                break;
        }
    }
    return stats;
}
