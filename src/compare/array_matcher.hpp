#pragma once

/*
    Reconcile two arrays element by element.

    Index strategy: pair elements by position; the shorter array is padded
    with absent slots.

    Value strategy: pair elements by best content match regardless of order.
    This is a greedy approximation of minimum-cost bipartite matching; the
    document matcher solves its (higher stakes) pairing exactly instead.
*/

#include "compare/comparator.hpp"
#include "compare/options.hpp"
#include "model/diff_result.hpp"

namespace nestdiff {

DiffResult
compare_arrays(const Comparator& comparator,
               const ValuePtr& a,
               const ValuePtr& b,
               const Path& path,
               ArrayStrategy strategy);

DiffResult
compare_arrays_by_index(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b, const Path& path);

DiffResult
compare_arrays_by_value(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b, const Path& path);

}  // namespace nestdiff
