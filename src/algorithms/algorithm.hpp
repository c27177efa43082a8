#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <string>
#include <vector>

namespace textdiff {

using std::int64_t;
using std::size_t;

// A unit that A and B have in common, by its index on each side.
struct CommonPair {
    size_t a_index;
    size_t b_index;
};

enum class AlignResultStatus {
    OK,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;
};

struct AlignResult {
    AlignResultStatus status = AlignResultStatus::OK;

    // Common units only, in order.
    std::vector<CommonPair> common_sequence;
};

template <typename Unit>
class Algorithm {
   public:
    const DiffInput<Unit>& diff_input_;

    Algorithm(const DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    virtual AlignResult
    align() = 0;

    AlignResult
    compute() {
        AlignResult result;

        auto N = diff_input_.A.size();
        auto M = diff_input_.B.size();

        // Nothing in common with an empty side.
        if (N == 0 || M == 0) {
            result.status = (N == 0 && M == 0) ? AlignResultStatus::NoChanges : AlignResultStatus::OK;
            return result;
        }

        return align();
    }
};

}  // namespace textdiff
