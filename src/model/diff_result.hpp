#pragma once

/*
    Output tree of a structural comparison.

    A node with status Same and no children is an atomic value that was equal
    on both sides. Containers are Modified iff at least one child is not Same.
    meta.diff_count sums the atomic differences underneath a node; it is a
    matching cost, not something the renderers show.
*/

#include "model/value.hpp"

#include <gsl/span>

#include <cstdint>
#include <string>
#include <vector>

namespace nestdiff {

enum class DiffStatus {
    Same,
    Modified,
    Added,
    Deleted,
};

// Object keys, "[i]" array segments, or "line i" for multiline strings.
using Path = std::vector<std::string>;

struct DiffMeta {
    int64_t diff_count = 0;
    std::string note;
};

struct DiffResult {
    DiffStatus status = DiffStatus::Same;
    Path path;

    ValuePtr from;
    ValuePtr to;

    std::vector<DiffResult> children;
    DiffMeta meta;
};

DiffResult
make_diff(DiffStatus status, Path path, ValuePtr from, ValuePtr to, int64_t diff_count);

// Append `child` and fold its status and diff count into `parent`.
void
add_child(DiffResult& parent, DiffResult child);

Path
child_path(const Path& parent, std::string segment);

// "[i]"
std::string
index_segment(std::size_t index);

// True iff any node in the forest has a status other than Same.
bool
has_differences(gsl::span<const DiffResult> results);

// True iff `diff` or any of its descendants is not Same.
bool
has_changed_descendants(const DiffResult& diff);

std::string
repr(DiffStatus status);

std::string
path_string(const Path& path, const std::string& separator = ".");

}  // namespace nestdiff
