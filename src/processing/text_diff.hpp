#pragma once

/*
    Text comparison engine.

    Both texts are tokenized at the requested granularity, the normalized
    tokens are aligned by their longest common subsequence, and the two
    token sequences are then walked against that subsequence to classify
    every token as unchanged, added, removed or modified.

    All functions here are pure; a DiffResult is a value that owns its data.
*/

#include "algorithms/algorithm.hpp"
#include "processing/change.hpp"
#include "processing/options.hpp"
#include "processing/tokenizer.hpp"

#include <string>
#include <vector>

namespace textdiff {

// Longest common subsequence of two token sequences.
AlignResult
align_tokens(const std::vector<Token>& a, const std::vector<Token>& b);

// Walk A, B and their common subsequence in lockstep:
//   - both tokens equal the next common token: unchanged
//   - only A's token does: B's token was added
//   - only B's token does: A's token was removed
//   - neither does: the pair was modified
// Whatever is left on one side once the other runs out is removed/added.
std::vector<ChangeRecord>
classify_changes(const std::vector<Token>& a,
                 const std::vector<Token>& b,
                 const std::vector<CommonPair>& common_sequence,
                 const DiffOptions& options);

DiffResult
diff(const std::string& original, const std::string& modified, const DiffOptions& options = {});

}  // namespace textdiff
