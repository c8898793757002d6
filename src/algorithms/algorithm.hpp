#pragma once

/*
    Common types for sequence diff algorithms.

    An algorithm takes two sequences A and B of comparable units and
    produces an edit sequence that turns A into B. The refinement engine runs
    it over the tokens of paired hunk lines.
*/

#include <cinttypes>
#include <cstddef>
#include <gsl/span>
#include <vector>

namespace patchy {

using std::int64_t;
using std::size_t;

struct Coordinate {
    int64_t x;
    int64_t y;
};

struct Move {
    Coordinate from;
    Coordinate to;
};

enum class EditType {
    Delete,
    Insert,
    Common,
};

struct EditIndex {
    bool valid;
    int64_t value;
    EditIndex() : valid(false), value(0) {
    }

    EditIndex(int64_t in_value) : valid(true), value(in_value) {
    }

    operator int64_t() const {
        return value;
    }
};

const EditIndex EditIndexInvalid{};

// One step of the edit sequence. Delete has a valid a_index, Insert a valid
// b_index, Common both.
struct Edit {
    EditType type;

    EditIndex a_index;
    EditIndex b_index;
};

enum class DiffResultStatus {
    OK,
    Failed,
    NoChanges,
};

template <typename Unit>
struct DiffInput {
    gsl::span<const Unit> A;
    gsl::span<const Unit> B;
};

struct DiffResult {
    DiffResultStatus status = DiffResultStatus::Failed;
    std::vector<Edit> edit_sequence;
};

template <typename Unit>
class Algorithm {
   public:
    const DiffInput<Unit>& diff_input_;

    Algorithm(const DiffInput<Unit>& diff_input) : diff_input_(diff_input) {
    }

    virtual ~Algorithm() = default;

    virtual DiffResult
    diff() = 0;

    // Handle the trivial inputs where one or both sides are empty, and
    // defer to the algorithm for the rest.
    DiffResult
    compute() {
        DiffResult result;

        auto N = static_cast<int64_t>(diff_input_.A.size());
        auto M = static_cast<int64_t>(diff_input_.B.size());

        if (N == 0 && M == 0) {
            result.status = DiffResultStatus::NoChanges;
            return result;
        }

        if (N == 0) {
            for (int64_t i = 0; i < M; i++) {
                result.edit_sequence.push_back({EditType::Insert, EditIndexInvalid, EditIndex(i)});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        if (M == 0) {
            for (int64_t i = 0; i < N; i++) {
                result.edit_sequence.push_back({EditType::Delete, EditIndex(i), EditIndexInvalid});
            }
            result.status = DiffResultStatus::OK;
            return result;
        }

        return diff();
    }
};

}  // namespace patchy
