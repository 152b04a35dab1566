#pragma once

/*
    RFC 6902 rendering of a diff forest.

    Modified leaves become "replace", deletions "remove" and additions "add"
    carrying the whole value. A multiline string that changed is replaced as
    a whole; its line children never appear in the patch.
*/

#include "model/diff_result.hpp"

#include <gsl/span>

#include <string>
#include <vector>

namespace nestdiff {

// "/a/0/b~1c" for the path ["a", "[0]", "b/c"]; "" for the root.
std::string
json_pointer(const Path& path);

// One compact JSON object per operation, in diff order.
std::vector<std::string>
json_patch_operations(gsl::span<const DiffResult> results);

// "[]" when empty, otherwise "[", one operation per line, "]".
std::vector<std::string>
json_patch_render(gsl::span<const DiffResult> results);

}  // namespace nestdiff
