#pragma once

#include "model/diff_result.hpp"
#include "util/color.hpp"

#include <gsl/span>

#include <cstdint>
#include <string>
#include <vector>

namespace nestdiff {

struct UnifiedOptions {
    bool show_all = false;
    int64_t context_lines = 3;
    bool color = false;
    ColorScheme colors;
};

// One output line per element, without trailing newlines. Documents are
// separated by a "---" line.
std::vector<std::string>
unified_diff_render(gsl::span<const DiffResult> results, const UnifiedOptions& options);

}  // namespace nestdiff
