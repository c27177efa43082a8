#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace textdiff {

enum class ChangeKind {
    Unchanged,
    Added,
    Removed,
    Modified,
};

std::string
to_string(ChangeKind kind);

struct KeyWords {
    std::vector<std::string> added;
    std::vector<std::string> removed;

    bool
    operator==(const KeyWords& other) const {
        return added == other.added && removed == other.removed;
    }
};

// One entry in a diff. Which fields are set depends on the kind:
//   Unchanged, Modified: original_text and modified_text
//   Removed:             original_text
//   Added:               modified_text
// Line numbers are 1-indexed and only set for line granularity. The
// semantic fields are only set on Modified entries when semantic analysis
// is enabled.
struct ChangeRecord {
    ChangeKind kind = ChangeKind::Unchanged;

    std::optional<std::string> original_text;
    std::optional<std::string> modified_text;

    std::optional<int64_t> original_line;
    std::optional<int64_t> modified_line;

    std::optional<double> similarity;
    std::optional<std::string> explanation;
    std::optional<KeyWords> key_words;

    bool
    operator==(const ChangeRecord& other) const {
        return kind == other.kind && original_text == other.original_text &&
               modified_text == other.modified_text && original_line == other.original_line &&
               modified_line == other.modified_line && similarity == other.similarity &&
               explanation == other.explanation && key_words == other.key_words;
    }
};

struct ChangeStats {
    int64_t added = 0;
    int64_t removed = 0;
    int64_t modified = 0;
    int64_t unchanged = 0;

    int64_t
    total() const {
        return added + removed + modified + unchanged;
    }

    ChangeStats&
    operator+=(const ChangeStats& other) {
        added += other.added;
        removed += other.removed;
        modified += other.modified;
        unchanged += other.unchanged;
        return *this;
    }

    bool
    operator==(const ChangeStats& other) const {
        return added == other.added && removed == other.removed && modified == other.modified &&
               unchanged == other.unchanged;
    }
};

struct DiffResult {
    std::vector<ChangeRecord> changes;
    ChangeStats stats;

    bool
    operator==(const DiffResult& other) const {
        return changes == other.changes && stats == other.stats;
    }
};

ChangeStats
count_changes(const std::vector<ChangeRecord>& changes);

}  // namespace textdiff
