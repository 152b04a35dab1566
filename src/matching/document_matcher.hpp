#pragma once

/*
    Pair up the top-level documents of two inputs.

    Every (a, b) pair is compared up front. The pairing, including pure
    deletions and additions, is then chosen by an exact minimum-cost
    assignment over a (|A|+|B|) square matrix:

                  b[0..|B|)                 dummy[0..|A|)
        a[i]      diff(a,b) + penalty       delete a[i] on the diagonal
        dummy     add b[j] on the diagonal  0

    Off-diagonal deletion/addition slots hold a forbidding cost.
*/

#include "compare/options.hpp"
#include "model/diff_result.hpp"
#include "model/value.hpp"

#include <gsl/span>

#include <cstdint>
#include <vector>

namespace nestdiff {

class Comparator;

// Forbidden deletion/addition slots.
const int64_t kForbiddenCost = int64_t{1} << 40;

// clang-format off
const int64_t kKindMismatchPenalty       = int64_t{1} << 20;
const int64_t kApiVersionMismatchPenalty = 8;
const int64_t kNameMismatchPenalty       = 4;
const int64_t kNamespaceMismatchPenalty  = 2;
// clang-format on

// Extra pairing cost for manifest-like documents (kind, apiVersion,
// metadata.name, metadata.namespace). Zero unless both are objects and at
// least one of them has a `kind`.
int64_t
mismatch_penalty(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b);

// One result per final pairing: for each a-side document in order its
// paired diff or its deletion, then the additions of unpaired b-side
// documents in order.
std::vector<DiffResult>
match_documents(gsl::span<const ValuePtr> docs_a, gsl::span<const ValuePtr> docs_b, const DiffOptions& options);

}  // namespace nestdiff
