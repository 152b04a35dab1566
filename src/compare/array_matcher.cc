#include "compare/array_matcher.hpp"

#include <algorithm>
#include <optional>
#include <vector>

using namespace nestdiff;

DiffResult
nestdiff::compare_arrays(const Comparator& comparator,
                         const ValuePtr& a,
                         const ValuePtr& b,
                         const Path& path,
                         ArrayStrategy strategy) {
    if (strategy == ArrayStrategy::kValue) {
        return compare_arrays_by_value(comparator, a, b, path);
    }
    return compare_arrays_by_index(comparator, a, b, path);
}

DiffResult
nestdiff::compare_arrays_by_index(const Comparator& comparator,
                                  const ValuePtr& a,
                                  const ValuePtr& b,
                                  const Path& path) {
    DiffResult result = make_diff(DiffStatus::Same, path, a, b, 0);

    const auto& elements_a = a->as_array();
    const auto& elements_b = b->as_array();
    const auto max_len = std::max(elements_a.size(), elements_b.size());

    result.children.reserve(max_len);
    for (std::size_t i = 0; i < max_len; i++) {
        ValuePtr element_a = i < elements_a.size() ? elements_a[i] : nullptr;
        ValuePtr element_b = i < elements_b.size() ? elements_b[i] : nullptr;
        add_child(result, comparator.compare_at(element_a, element_b, child_path(path, index_segment(i))));
    }

    return result;
}

// Compare every (i, j) pair, then repeatedly take the cheapest pair whose row
// and column are both unused. Greedy, so not a guaranteed minimum; the sort
// over all N*M candidates dominates the cost. Elements left over on either
// side become deletions or additions at their own index.
DiffResult
nestdiff::compare_arrays_by_value(const Comparator& comparator,
                                  const ValuePtr& a,
                                  const ValuePtr& b,
                                  const Path& path) {
    DiffResult result = make_diff(DiffStatus::Same, path, a, b, 0);

    const auto& elements_a = a->as_array();
    const auto& elements_b = b->as_array();
    const std::size_t n = elements_a.size();
    const std::size_t m = elements_b.size();

    struct Candidate {
        std::size_t index_a;
        std::size_t index_b;
        int64_t cost;
    };

    // A matched pair is reported at its a-side index, so compute it there
    // right away.
    std::vector<DiffResult> pair_diffs;
    std::vector<Candidate> candidates;
    pair_diffs.reserve(n * m);
    candidates.reserve(n * m);
    for (std::size_t i = 0; i < n; i++) {
        const auto element_path = child_path(path, index_segment(i));
        for (std::size_t j = 0; j < m; j++) {
            pair_diffs.push_back(comparator.compare_at(elements_a[i], elements_b[j], element_path));
            candidates.push_back({i, j, pair_diffs.back().meta.diff_count});
        }
    }

    // Stable: equal costs keep discovery order, favouring lower indices.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& lhs, const Candidate& rhs) { return lhs.cost < rhs.cost; });

    std::vector<std::optional<std::size_t>> match_of_a(n);
    std::vector<bool> used_b(m, false);
    std::size_t matched = 0;
    const std::size_t max_matches = std::min(n, m);
    for (const auto& candidate : candidates) {
        if (matched == max_matches) {
            break;
        }
        if (match_of_a[candidate.index_a] || used_b[candidate.index_b]) {
            continue;
        }
        match_of_a[candidate.index_a] = candidate.index_b;
        used_b[candidate.index_b] = true;
        matched++;
    }

    result.children.reserve(n + m - matched);

    // Matches and deletions in a-side order, then additions in b-side order.
    for (std::size_t i = 0; i < n; i++) {
        if (match_of_a[i]) {
            add_child(result, std::move(pair_diffs[i * m + *match_of_a[i]]));
        } else {
            add_child(result, comparator.compare_at(elements_a[i], nullptr, child_path(path, index_segment(i))));
        }
    }

    for (std::size_t j = 0; j < m; j++) {
        if (!used_b[j]) {
            add_child(result, comparator.compare_at(nullptr, elements_b[j], child_path(path, index_segment(j))));
        }
    }

    return result;
}
