#pragma once

/*
    Line-by-line comparison of two strings where at least one holds a line
    break. Both strings are split into synthetic arrays of lines and compared
    by index (line order matters, so never by value). Child path segments are
    relabeled from "[i]" to "line i"; the outer node keeps the unsplit
    strings in from/to.
*/

#include "compare/comparator.hpp"
#include "model/diff_result.hpp"

#include <string>

namespace nestdiff {

DiffResult
compare_multiline_strings(const Comparator& comparator, const ValuePtr& a, const ValuePtr& b, const Path& path);

// "[3]" -> "line 3". Other segments are returned unchanged.
std::string
line_segment_from_index(const std::string& segment);

}  // namespace nestdiff
