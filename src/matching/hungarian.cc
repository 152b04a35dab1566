#include "matching/hungarian.hpp"

#include <limits>

using namespace nestdiff;

namespace {

const int64_t kInfinity = std::numeric_limits<int64_t>::max() / 4;

}  // namespace

// Shortest augmenting path formulation with row potentials `u` and column
// potentials `v`. Rows are added one at a time; each pass grows a tree of
// tight edges until it reaches a free column, then flips the path.
// Index 0 is a virtual column, so the arrays below are 1-based.
std::vector<std::size_t>
nestdiff::solve_assignment(const CostMatrix& cost) {
    const std::size_t n = cost.size();
    if (n == 0) {
        return {};
    }

    std::vector<int64_t> u(n + 1, 0);
    std::vector<int64_t> v(n + 1, 0);
    std::vector<std::size_t> row_of_col(n + 1, 0);  // p
    std::vector<std::size_t> way(n + 1, 0);

    for (std::size_t row = 1; row <= n; row++) {
        row_of_col[0] = row;
        std::size_t col0 = 0;

        std::vector<int64_t> min_slack(n + 1, kInfinity);
        std::vector<bool> used(n + 1, false);

        do {
            used[col0] = true;
            const std::size_t row0 = row_of_col[col0];
            int64_t delta = kInfinity;
            std::size_t col1 = 0;

            for (std::size_t col = 1; col <= n; col++) {
                if (used[col]) {
                    continue;
                }
                const int64_t reduced = cost.at(row0 - 1, col - 1) - u[row0] - v[col];
                if (reduced < min_slack[col]) {
                    min_slack[col] = reduced;
                    way[col] = col0;
                }
                // Strict comparison: the lowest column wins ties.
                if (min_slack[col] < delta) {
                    delta = min_slack[col];
                    col1 = col;
                }
            }

            for (std::size_t col = 0; col <= n; col++) {
                if (used[col]) {
                    u[row_of_col[col]] += delta;
                    v[col] -= delta;
                } else {
                    min_slack[col] -= delta;
                }
            }

            col0 = col1;
        } while (row_of_col[col0] != 0);

        // Flip the augmenting path.
        do {
            const std::size_t col1 = way[col0];
            row_of_col[col0] = row_of_col[col1];
            col0 = col1;
        } while (col0 != 0);
    }

    std::vector<std::size_t> assignment(n, 0);
    for (std::size_t col = 1; col <= n; col++) {
        assignment[row_of_col[col] - 1] = col - 1;
    }
    return assignment;
}

int64_t
nestdiff::assignment_cost(const CostMatrix& cost, const std::vector<std::size_t>& assignment) {
    int64_t total = 0;
    for (std::size_t row = 0; row < assignment.size(); row++) {
        total += cost.at(row, assignment[row]);
    }
    return total;
}
