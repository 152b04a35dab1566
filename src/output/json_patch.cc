#include "output/json_patch.hpp"

#include "util/strings.hpp"

#include <fmt/format.h>

using namespace nestdiff;

namespace {

std::string
escape_pointer_segment(const std::string& segment) {
    std::string escaped;
    escaped.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

bool
is_index_segment(const std::string& segment) {
    if (segment.size() < 3 || segment.front() != '[' || segment.back() != ']') {
        return false;
    }
    for (std::size_t i = 1; i + 1 < segment.size(); i++) {
        if (segment[i] < '0' || segment[i] > '9') {
            return false;
        }
    }
    return true;
}

bool
is_multiline_diff(const DiffResult& diff) {
    return !diff.children.empty() && diff.from && diff.to && diff.from->is_string() && diff.to->is_string();
}

void
collect_operations(const DiffResult& diff, std::vector<std::string>& ops) {
    const auto pointer = json_quote(json_pointer(diff.path));

    switch (diff.status) {
        case DiffStatus::Same:
            for (const auto& child : diff.children) {
                if (child.status != DiffStatus::Same) {
                    collect_operations(child, ops);
                }
            }
            break;

        case DiffStatus::Modified:
            if (!diff.children.empty() && !is_multiline_diff(diff)) {
                for (const auto& child : diff.children) {
                    collect_operations(child, ops);
                }
                break;
            }
            ops.push_back(fmt::format(R"({{"op": "replace", "path": {}, "value": {}}})", pointer, to_json(diff.to)));
            break;

        case DiffStatus::Deleted:
            ops.push_back(fmt::format(R"({{"op": "remove", "path": {}}})", pointer));
            break;

        case DiffStatus::Added:
            ops.push_back(fmt::format(R"({{"op": "add", "path": {}, "value": {}}})", pointer, to_json(diff.to)));
            break;
    }
}

}  // namespace

std::string
nestdiff::json_pointer(const Path& path) {
    std::string pointer;
    for (const auto& segment : path) {
        pointer += '/';
        if (is_index_segment(segment)) {
            pointer += segment.substr(1, segment.size() - 2);
        } else {
            pointer += escape_pointer_segment(segment);
        }
    }
    return pointer;
}

std::vector<std::string>
nestdiff::json_patch_operations(gsl::span<const DiffResult> results) {
    std::vector<std::string> ops;
    for (const auto& result : results) {
        collect_operations(result, ops);
    }
    return ops;
}

std::vector<std::string>
nestdiff::json_patch_render(gsl::span<const DiffResult> results) {
    const auto ops = json_patch_operations(results);
    if (ops.empty()) {
        return {"[]"};
    }

    std::vector<std::string> lines;
    lines.reserve(ops.size() + 2);
    lines.push_back("[");
    for (std::size_t i = 0; i < ops.size(); i++) {
        lines.push_back(fmt::format("  {}{}", ops[i], i + 1 < ops.size() ? "," : ""));
    }
    lines.push_back("]");
    return lines;
}
