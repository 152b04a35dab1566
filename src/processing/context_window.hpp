#pragma once

/*
    Choose which siblings of a diff tree level to render.

    Siblings whose subtree holds a change are anchors. With a context size
    C >= 0 every anchor pulls in up to C neighbours on each side. Runs that
    are separated by skipped siblings get an elision marker in between; the
    skipped edges before the first and after the last run do not.

    Used for the document list, for object and array children and for the
    lines of a multiline string alike.
*/

#include "model/diff_result.hpp"

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nestdiff {

struct ContextOptions {
    bool show_all = false;      // render everything, no windowing
    int64_t context_lines = 3;  // < 0: changed siblings only
};

struct WindowSlot {
    std::size_t index;
    bool gap_before;  // emit one elision marker before this sibling
};

std::vector<WindowSlot>
select_window(gsl::span<const DiffResult> siblings, const ContextOptions& options);

}  // namespace nestdiff
