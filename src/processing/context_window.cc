#include "processing/context_window.hpp"

#include <algorithm>

using namespace nestdiff;

namespace {

struct WindowRange {
    int64_t start;
    int64_t end;  // inclusive
};

// Ranges of consecutive siblings that contain changes.
std::vector<WindowRange>
find_anchor_ranges(gsl::span<const DiffResult> siblings) {
    std::vector<WindowRange> ranges;
    bool in_range = false;
    for (std::size_t i = 0; i < siblings.size(); i++) {
        const bool anchor = has_changed_descendants(siblings[i]);
        const auto index = static_cast<int64_t>(i);
        if (anchor && !in_range) {
            ranges.push_back({index, index});
            in_range = true;
        } else if (anchor) {
            ranges.back().end = index;
        } else {
            in_range = false;
        }
    }
    return ranges;
}

// Grow each range by `context_size` on both sides, clipped to the sibling
// list, and join ranges that touch or overlap.
std::vector<WindowRange>
extend_window_ranges(const std::vector<WindowRange>& anchor_ranges, int64_t context_size, int64_t count) {
    std::vector<WindowRange> context_ranges;
    for (const auto& range : anchor_ranges) {
        WindowRange extended{std::max<int64_t>(0, range.start - context_size),
                             std::min<int64_t>(count - 1, range.end + context_size)};

        if (!context_ranges.empty() && extended.start <= context_ranges.back().end + 1) {
            context_ranges.back().end = std::max(context_ranges.back().end, extended.end);
            continue;
        }
        context_ranges.push_back(extended);
    }
    return context_ranges;
}

}  // namespace

std::vector<WindowSlot>
nestdiff::select_window(gsl::span<const DiffResult> siblings, const ContextOptions& options) {
    std::vector<WindowSlot> slots;

    if (options.show_all) {
        slots.reserve(siblings.size());
        for (std::size_t i = 0; i < siblings.size(); i++) {
            slots.push_back({i, false});
        }
        return slots;
    }

    const auto anchor_ranges = find_anchor_ranges(siblings);

    // No context: only the changed siblings, never a marker.
    if (options.context_lines < 0) {
        for (const auto& range : anchor_ranges) {
            for (auto i = range.start; i <= range.end; i++) {
                slots.push_back({static_cast<std::size_t>(i), false});
            }
        }
        return slots;
    }

    const auto ranges =
        extend_window_ranges(anchor_ranges, options.context_lines, static_cast<int64_t>(siblings.size()));
    for (std::size_t r = 0; r < ranges.size(); r++) {
        for (auto i = ranges[r].start; i <= ranges[r].end; i++) {
            slots.push_back({static_cast<std::size_t>(i), r > 0 && i == ranges[r].start});
        }
    }
    return slots;
}
