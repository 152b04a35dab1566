#pragma once

// Kuhn-Munkres (Hungarian method) for square min-cost assignment; O(n^3).

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nestdiff {

// Square matrix of assignment costs, row-major.
class CostMatrix {
   public:
    explicit CostMatrix(std::size_t n, int64_t fill = 0) : n_(n), costs_(n * n, fill) {
    }

    std::size_t
    size() const {
        return n_;
    }

    int64_t&
    at(std::size_t row, std::size_t col) {
        return costs_[row * n_ + col];
    }

    int64_t
    at(std::size_t row, std::size_t col) const {
        return costs_[row * n_ + col];
    }

   private:
    std::size_t n_;
    std::vector<int64_t> costs_;
};

// Minimum-cost perfect assignment: result[row] = column. The result is a
// bijection for any finite matrix, and ties resolve the same way every run.
std::vector<std::size_t>
solve_assignment(const CostMatrix& cost);

// Sum of cost.at(row, assignment[row]).
int64_t
assignment_cost(const CostMatrix& cost, const std::vector<std::size_t>& assignment);

}  // namespace nestdiff
