#pragma once

// Greedy version of Myers difference algorithm; O((M+N) D) time, with one
// snapshot of V per D kept for backtracking.

#include "algorithms/algorithm.hpp"
#include "util/bipolar_array.hpp"

#include <gsl/span>

#include <algorithm>
#include <limits>
#include <vector>

namespace patchy {

template <typename Unit>
struct MyersGreedy : public Algorithm<Unit> {
   public:
    int64_t N;
    int64_t M;

    gsl::span<const Unit> A;
    gsl::span<const Unit> B;

    MyersGreedy(const DiffInput<Unit>& diff_input)
        : Algorithm<Unit>(diff_input)
        , N(static_cast<int64_t>(diff_input.A.size()))
        , M(static_cast<int64_t>(diff_input.B.size()))
        , A(diff_input.A)
        , B(diff_input.B) {
    }

    // Walk the diagonals until the end point is reached. Returns the edit
    // distance, or -1 when the inputs cannot be diffed.
    template <typename IndexSizeType>
    int64_t
    edit_distance(std::vector<BipolarArray<IndexSizeType>>& trace) {
        if (N == 0 || M == 0) {
            return -1;
        }

        const int64_t max = N + M;
        BipolarArray<IndexSizeType> v{-max - 1, max + 1};
        v[1] = 0;

        for (int64_t d = 0; d <= max; d++) {
            for (int64_t k = -d; k <= d; k += 2) {
                int64_t x = 0;
                if (k == -d || (k != d && v[k - 1] < v[k + 1])) {
                    x = static_cast<int64_t>(v[k + 1]);
                } else {
                    x = static_cast<int64_t>(v[k - 1]) + 1;
                }
                int64_t y = x - k;

                while (x < N && y < M && A[static_cast<size_t>(x)] == B[static_cast<size_t>(y)]) {
                    ++x;
                    ++y;
                }

                v[k] = static_cast<IndexSizeType>(x);

                if (x >= N && y >= M) {
                    trace.push_back(v);
                    return d;
                }
            }
            trace.push_back(v);
        }
        return -1;
    }

    // Backtrack from (N, M) to (0, 0), producing the edit sequence in
    // forward order.
    template <typename IndexSizeType>
    std::vector<Edit>
    backtrack(std::vector<BipolarArray<IndexSizeType>>& trace) {
        std::vector<Move> moves;
        int64_t x = N;
        int64_t y = M;
        for (int64_t d = static_cast<int64_t>(trace.size()) - 1; d >= 0; d--) {
            auto& v = trace[static_cast<size_t>(d)];

            int64_t k = x - y;
            int64_t prev_k = (k == -d || (k != d && v[k - 1] < v[k + 1])) ? k + 1 : k - 1;
            int64_t prev_x = d > 0 ? static_cast<int64_t>(v[prev_k]) : 0;
            int64_t prev_y = d > 0 ? prev_x - prev_k : 0;

            while (x > prev_x && y > prev_y) {
                moves.push_back({{x - 1, y - 1}, {x, y}});
                x--;
                y--;
            }

            if (d > 0) {
                moves.push_back({{prev_x, prev_y}, {x, y}});
            }

            x = prev_x;
            y = prev_y;
        }

        std::vector<Edit> edits;
        edits.reserve(moves.size());
        for (auto it = moves.crbegin(); it != moves.crend(); ++it) {
            const auto& from = it->from;
            const auto& to = it->to;
            if (from.x == to.x) {
                edits.push_back({EditType::Insert, EditIndexInvalid, EditIndex(from.y)});
            } else if (from.y == to.y) {
                edits.push_back({EditType::Delete, EditIndex(from.x), EditIndexInvalid});
            } else {
                edits.push_back({EditType::Common, EditIndex(from.x), EditIndex(from.y)});
            }
        }
        return edits;
    }

    template <typename IndexSizeType>
    DiffResult
    diff_impl() {
        DiffResult result;

        std::vector<BipolarArray<IndexSizeType>> trace;
        int64_t distance = edit_distance(trace);

        if (distance < 0) {
            result.status = DiffResultStatus::Failed;
            return result;
        }

        result.edit_sequence = backtrack(trace);
        result.status = distance == 0 ? DiffResultStatus::NoChanges : DiffResultStatus::OK;
        return result;
    }

    DiffResult
    diff() override {
        // Narrow index types keep the per-D snapshots small.
        constexpr auto u8_max = std::numeric_limits<uint8_t>::max();
        constexpr auto u16_max = std::numeric_limits<uint16_t>::max();
        if (N + M < u8_max) {
            return diff_impl<uint8_t>();
        } else if (N + M < u16_max) {
            return diff_impl<uint16_t>();
        }
        return diff_impl<uint32_t>();
    }
};

}  // namespace patchy
