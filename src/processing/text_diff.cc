#include "processing/text_diff.hpp"

#include "algorithms/lcs.hpp"
#include "processing/semantic.hpp"

#include <gsl/span>

#include <algorithm>

using namespace textdiff;

namespace {

// Running 1-indexed line counters; only used for line granularity.
struct LineCursor {
    bool enabled;
    int64_t original_line = 1;
    int64_t modified_line = 1;

    std::optional<int64_t>
    original() const {
        return enabled ? std::optional<int64_t>(original_line) : std::nullopt;
    }

    std::optional<int64_t>
    modified() const {
        return enabled ? std::optional<int64_t>(modified_line) : std::nullopt;
    }
};

ChangeRecord
make_unchanged(const Token& a, const Token& b, const LineCursor& lines) {
    ChangeRecord change;
    change.kind = ChangeKind::Unchanged;
    change.original_text = a.text;
    change.modified_text = b.text;
    change.original_line = lines.original();
    change.modified_line = lines.modified();
    return change;
}

ChangeRecord
make_added(const Token& b, const LineCursor& lines) {
    ChangeRecord change;
    change.kind = ChangeKind::Added;
    change.modified_text = b.text;
    change.modified_line = lines.modified();
    return change;
}

ChangeRecord
make_removed(const Token& a, const LineCursor& lines) {
    ChangeRecord change;
    change.kind = ChangeKind::Removed;
    change.original_text = a.text;
    change.original_line = lines.original();
    return change;
}

ChangeRecord
make_modified(const Token& a, const Token& b, const LineCursor& lines, const DiffOptions& options) {
    ChangeRecord change;
    change.kind = ChangeKind::Modified;
    change.original_text = a.text;
    change.modified_text = b.text;
    change.original_line = lines.original();
    change.modified_line = lines.modified();

    if (options.semantic_analysis) {
        auto analysis = analyze_change(a.text, b.text, options.similarity_threshold);
        change.similarity = analysis.similarity;
        change.explanation = std::move(analysis.explanation);
        change.key_words = std::move(analysis.key_words);
    }
    return change;
}

}  // namespace

AlignResult
textdiff::align_tokens(const std::vector<Token>& a, const std::vector<Token>& b) {
    DiffInput<Token> diff_input{gsl::span<const Token>{a}, gsl::span<const Token>{b}};
    return Lcs<Token>(diff_input).compute();
}

std::vector<ChangeRecord>
textdiff::classify_changes(const std::vector<Token>& a,
                           const std::vector<Token>& b,
                           const std::vector<CommonPair>& common_sequence,
                           const DiffOptions& options) {
    std::vector<ChangeRecord> changes;
    changes.reserve(std::max(a.size(), b.size()));

    LineCursor lines{options.granularity == Granularity::Line};

    const auto N = a.size();
    const auto M = b.size();
    const auto K = common_sequence.size();

    // The next unconsumed common token, if any.
    auto anchor = [&](std::size_t k) -> const Token* {
        if (k >= K) {
            return nullptr;
        }
        return &a[common_sequence[k].a_index];
    };

    std::size_t i = 0, j = 0, k = 0;
    while (i < N && j < M) {
        const Token* next = anchor(k);
        const bool a_on_anchor = next && a[i] == *next;
        const bool b_on_anchor = next && b[j] == *next;

        if (a_on_anchor && b_on_anchor) {
            changes.push_back(make_unchanged(a[i], b[j], lines));
            i++;
            j++;
            k++;
            lines.original_line++;
            lines.modified_line++;
        } else if (a_on_anchor) {
            // B is ahead of the anchor.
            changes.push_back(make_added(b[j], lines));
            j++;
            lines.modified_line++;
        } else if (b_on_anchor) {
            changes.push_back(make_removed(a[i], lines));
            i++;
            lines.original_line++;
        } else {
            changes.push_back(make_modified(a[i], b[j], lines, options));
            i++;
            j++;
            lines.original_line++;
            lines.modified_line++;
        }
    }

    for (; i < N; i++) {
        changes.push_back(make_removed(a[i], lines));
        lines.original_line++;
    }

    for (; j < M; j++) {
        changes.push_back(make_added(b[j], lines));
        lines.modified_line++;
    }

    return changes;
}

DiffResult
textdiff::diff(const std::string& original, const std::string& modified, const DiffOptions& options) {
    auto tokens_a = tokenize(original, options);
    auto tokens_b = tokenize(modified, options);

    auto alignment = align_tokens(tokens_a, tokens_b);

    DiffResult result;
    result.changes = classify_changes(tokens_a, tokens_b, alignment.common_sequence, options);
    result.stats = count_changes(result.changes);
    return result;
}
