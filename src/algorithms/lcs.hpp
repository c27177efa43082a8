#pragma once

// Longest common subsequence by dynamic programming; O(N M) time and space.
//
// Backtracking starts at (N, M). Equal units are taken diagonally. Otherwise
// we step back on A only when that keeps a strictly longer subsequence, and
// step back on B in every other case, ties included. Changing the tie rule
// changes which units later show up as added or removed.

#include "algorithm.hpp"

#include <gsl/span>
#include <algorithm>
#include <limits>
#include <vector>

namespace textdiff {

template <typename Unit>
struct Lcs : public Algorithm<Unit> {
   public:
    int64_t N;
    int64_t M;

    const gsl::span<const Unit>& A;
    const gsl::span<const Unit>& B;

    Lcs(const DiffInput<Unit>& diff_input)
        : Algorithm<Unit>(diff_input)
        , N(static_cast<int64_t>(diff_input.A.size()))
        , M(static_cast<int64_t>(diff_input.B.size()))
        , A(diff_input.A)
        , B(diff_input.B) {
    }

    virtual ~Lcs() {
    }

    // Row-major (N+1) x (M+1) table of prefix LCS lengths.
    template <typename CellType>
    void
    do_fill(std::vector<CellType>& dp) {
        const auto width = static_cast<size_t>(M + 1);
        dp.assign(static_cast<size_t>(N + 1) * width, 0);

        for (int64_t i = 1; i <= N; i++) {
            const auto row = static_cast<size_t>(i) * width;
            const auto prev_row = static_cast<size_t>(i - 1) * width;
            for (int64_t j = 1; j <= M; j++) {
                const auto col = static_cast<size_t>(j);
                if (A[i - 1] == B[j - 1]) {
                    dp[row + col] = static_cast<CellType>(dp[prev_row + col - 1] + 1);
                } else {
                    dp[row + col] = std::max(dp[prev_row + col], dp[row + col - 1]);
                }
            }
        }
    }

    template <typename CellType>
    void
    do_backtrack(const std::vector<CellType>& dp, std::vector<CommonPair>& common_sequence) {
        const auto width = static_cast<size_t>(M + 1);
        auto at = [&](int64_t i, int64_t j) { return dp[static_cast<size_t>(i) * width + static_cast<size_t>(j)]; };

        int64_t i = N;
        int64_t j = M;
        while (i > 0 && j > 0) {
            if (A[i - 1] == B[j - 1]) {
                common_sequence.push_back({static_cast<size_t>(i - 1), static_cast<size_t>(j - 1)});
                i--;
                j--;
            } else if (at(i - 1, j) > at(i, j - 1)) {
                i--;
            } else {
                j--;
            }
        }

        // We collected the subsequence backwards.
        std::reverse(common_sequence.begin(), common_sequence.end());
    }

    template <typename CellType>
    AlignResult
    align_impl() {
        AlignResult result;

        std::vector<CellType> dp;
        do_fill(dp);
        do_backtrack(dp, result.common_sequence);

        auto common = static_cast<int64_t>(result.common_sequence.size());
        result.status = (common == N && common == M) ? AlignResultStatus::NoChanges : AlignResultStatus::OK;
        return result;
    }

    AlignResult
    align() {
        // A cell never exceeds min(N, M); use the smallest type that holds it.
        constexpr auto u16_max = std::numeric_limits<uint16_t>::max();
        constexpr auto u32_max = std::numeric_limits<uint32_t>::max();
        const auto longest = std::min(N, M);
        if (longest < u16_max) {
            return align_impl<uint16_t>();
        } else if (longest < u32_max) {
            return align_impl<uint32_t>();
        }
        return align_impl<uint64_t>();
    }
};

}  // namespace textdiff
