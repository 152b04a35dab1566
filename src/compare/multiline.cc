#include "compare/multiline.hpp"

#include "compare/array_matcher.hpp"
#include "util/strings.hpp"

using namespace nestdiff;

namespace {

ValuePtr
make_line_array(const Value& text) {
    Value::Array lines;
    for (auto& line : split_lines(text.as_string())) {
        lines.push_back(make_string(std::move(line), text.meta));
    }
    return make_array(std::move(lines), text.meta);
}

}  // namespace

std::string
nestdiff::line_segment_from_index(const std::string& segment) {
    if (segment.size() >= 2 && segment.front() == '[' && segment.back() == ']') {
        return "line " + segment.substr(1, segment.size() - 2);
    }
    return segment;
}

DiffResult
nestdiff::compare_multiline_strings(const Comparator& comparator,
                                    const ValuePtr& a,
                                    const ValuePtr& b,
                                    const Path& path) {
    auto lines_a = make_line_array(*a);
    auto lines_b = make_line_array(*b);

    DiffResult lines = compare_arrays_by_index(comparator, lines_a, lines_b, path);

    DiffResult result = make_diff(lines.status, path, a, b, lines.meta.diff_count);
    if (lines.status == DiffStatus::Same) {
        return result;
    }

    result.children.reserve(lines.children.size());
    for (auto& child : lines.children) {
        if (!child.path.empty()) {
            child.path.back() = line_segment_from_index(child.path.back());
        }
        result.children.push_back(std::move(child));
    }

    return result;
}
