#include "matching/document_matcher.hpp"

#include "compare/comparator.hpp"
#include "matching/hungarian.hpp"
#include "util/log.hpp"

#include <fmt/format.h>

using namespace nestdiff;

namespace {

// Absent on both sides matches; absent on one side does not.
bool
field_matches(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b) {
    if (!a && !b) {
        return true;
    }
    if (!a || !b) {
        return false;
    }
    return comparator.compare(a, b).status == DiffStatus::Same;
}

}  // namespace

int64_t
nestdiff::mismatch_penalty(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b) {
    if (!a || !b || !a->is_object() || !b->is_object()) {
        return 0;
    }

    const auto kind_a = find_field(a, "kind");
    const auto kind_b = find_field(b, "kind");
    if (!kind_a && !kind_b) {
        return 0;
    }

    int64_t penalty = 0;
    if (!field_matches(comparator, kind_a, kind_b)) {
        penalty += kKindMismatchPenalty;
    }
    if (!field_matches(comparator, find_field(a, "apiVersion"), find_field(b, "apiVersion"))) {
        penalty += kApiVersionMismatchPenalty;
    }

    const auto metadata_a = find_field(a, "metadata");
    const auto metadata_b = find_field(b, "metadata");
    if (!field_matches(comparator, find_field(metadata_a, "name"), find_field(metadata_b, "name"))) {
        penalty += kNameMismatchPenalty;
    }
    if (!field_matches(comparator, find_field(metadata_a, "namespace"), find_field(metadata_b, "namespace"))) {
        penalty += kNamespaceMismatchPenalty;
    }

    return penalty;
}

std::vector<DiffResult>
nestdiff::match_documents(gsl::span<const ValuePtr> docs_a,
                          gsl::span<const ValuePtr> docs_b,
                          const DiffOptions& options) {
    const Comparator comparator{options};

    if (docs_a.size() == 1 && docs_b.size() == 1) {
        return {comparator.compare(docs_a[0], docs_b[0])};
    }

    const std::size_t size_a = docs_a.size();
    const std::size_t size_b = docs_b.size();
    const std::size_t n = size_a + size_b;

    // All compare calls happen here; the results are reused below.
    std::vector<DiffResult> pair_diffs;
    std::vector<DiffResult> deletions;
    std::vector<DiffResult> additions;
    pair_diffs.reserve(size_a * size_b);
    deletions.reserve(size_a);
    additions.reserve(size_b);

    CostMatrix cost{n, 0};

    for (std::size_t i = 0; i < size_a; i++) {
        for (std::size_t j = 0; j < size_b; j++) {
            pair_diffs.push_back(comparator.compare(docs_a[i], docs_b[j]));
            cost.at(i, j) = pair_diffs.back().meta.diff_count + mismatch_penalty(comparator, docs_a[i], docs_b[j]);
        }
    }

    for (std::size_t i = 0; i < size_a; i++) {
        deletions.push_back(comparator.compare(docs_a[i], nullptr));
        for (std::size_t j = size_b; j < n; j++) {
            cost.at(i, j) = (j == size_b + i) ? deletions.back().meta.diff_count : kForbiddenCost;
        }
    }

    for (std::size_t j = 0; j < size_b; j++) {
        additions.push_back(comparator.compare(nullptr, docs_b[j]));
        for (std::size_t i = size_a; i < n; i++) {
            cost.at(i, j) = (i == size_a + j) ? additions.back().meta.diff_count : kForbiddenCost;
        }
    }

    const auto assignment = solve_assignment(cost);
    NESTDIFF_DEBUG("document matcher: {}x{} documents, assignment cost {}\n", size_a, size_b,
                   assignment_cost(cost, assignment));

    std::vector<DiffResult> results;
    std::vector<bool> paired_b(size_b, false);
    for (std::size_t i = 0; i < size_a; i++) {
        const std::size_t j = assignment[i];
        if (j < size_b) {
            NESTDIFF_DEBUG("  a[{}] <-> b[{}] ({})\n", i, j, repr(pair_diffs[i * size_b + j].status));
            paired_b[j] = true;
            results.push_back(std::move(pair_diffs[i * size_b + j]));
        } else {
            NESTDIFF_DEBUG("  a[{}] deleted\n", i);
            results.push_back(std::move(deletions[i]));
        }
    }

    for (std::size_t j = 0; j < size_b; j++) {
        if (!paired_b[j]) {
            NESTDIFF_DEBUG("  b[{}] added\n", j);
            results.push_back(std::move(additions[j]));
        }
    }

    return results;
}
