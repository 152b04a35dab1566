#include "model/diff_result.hpp"

#include "util/strings.hpp"

#include <fmt/format.h>

using namespace nestdiff;

DiffResult
nestdiff::make_diff(DiffStatus status, Path path, ValuePtr from, ValuePtr to, int64_t diff_count) {
    DiffResult result;
    result.status = status;
    result.path = std::move(path);
    result.from = std::move(from);
    result.to = std::move(to);
    result.meta.diff_count = diff_count;
    return result;
}

void
nestdiff::add_child(DiffResult& parent, DiffResult child) {
    if (child.status != DiffStatus::Same) {
        parent.status = DiffStatus::Modified;
        parent.meta.diff_count += child.meta.diff_count;
    }
    parent.children.push_back(std::move(child));
}

Path
nestdiff::child_path(const Path& parent, std::string segment) {
    Path path;
    path.reserve(parent.size() + 1);
    path.insert(path.end(), parent.begin(), parent.end());
    path.push_back(std::move(segment));
    return path;
}

std::string
nestdiff::index_segment(std::size_t index) {
    return fmt::format("[{}]", index);
}

bool
nestdiff::has_differences(gsl::span<const DiffResult> results) {
    for (const auto& result : results) {
        if (has_changed_descendants(result)) {
            return true;
        }
    }
    return false;
}

bool
nestdiff::has_changed_descendants(const DiffResult& diff) {
    if (diff.status != DiffStatus::Same) {
        return true;
    }
    for (const auto& child : diff.children) {
        if (has_changed_descendants(child)) {
            return true;
        }
    }
    return false;
}

std::string
nestdiff::repr(DiffStatus status) {
    switch (status) {
        case DiffStatus::Same:
            return "Same";
        case DiffStatus::Modified:
            return "Modified";
        case DiffStatus::Added:
            return "Added";
        case DiffStatus::Deleted:
            return "Deleted";
    }
    return "Unknown";
}

std::string
nestdiff::path_string(const Path& path, const std::string& separator) {
    return join(path, separator);
}
