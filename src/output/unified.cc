#include "output/unified.hpp"

#include "processing/context_window.hpp"

#include <fmt/format.h>

using namespace nestdiff;

namespace {

class UnifiedWriter {
   public:
    explicit UnifiedWriter(const UnifiedOptions& options)
        : options_(options), context_{options.show_all, options.context_lines} {}

    void
    document(const DiffResult& diff);

    void
    separator() {
        lines_.push_back("---");
    }

    void
    marker(const std::string& lead, const std::string& indent) {
        emit(options_.colors.marker, fmt::format("{}{}...", lead, indent));
    }

    std::vector<std::string>
    take() {
        return std::move(lines_);
    }

   private:
    void
    node(const DiffResult& diff, const std::string& indent);

    void
    children(const std::vector<DiffResult>& siblings, const std::string& indent);

    void
    multiline(const DiffResult& diff, const std::string& indent);

    void
    line(const DiffResult& diff, const std::string& indent);

    void
    added_or_deleted(const ValuePtr& value, const Path& path, const std::string& indent, bool added);

    void
    structure(const ValuePtr& value, const std::string& indent, bool added);

    void
    emit(const TermStyle& style, std::string text) {
        lines_.push_back(options_.color ? style.apply(text) : std::move(text));
    }

    void
    emit_plain(std::string text) {
        lines_.push_back(std::move(text));
    }

    UnifiedOptions options_;
    ContextOptions context_;
    std::vector<std::string> lines_;
};

std::string
display_path(const Path& path) {
    auto s = path_string(path);
    return s.empty() ? s : " " + s;
}

// " a.b: value", or " value" for a document root.
std::string
labelled(const Path& path, const std::string& value) {
    if (path.empty()) {
        return " " + value;
    }
    return fmt::format("{}: {}", display_path(path), value);
}

bool
is_multiline_diff(const DiffResult& diff) {
    return !diff.children.empty() && diff.from && diff.to && diff.from->is_string() && diff.to->is_string();
}

void
UnifiedWriter::document(const DiffResult& diff) {
    node(diff, "");
}

void
UnifiedWriter::node(const DiffResult& diff, const std::string& indent) {
    switch (diff.status) {
        case DiffStatus::Same:
            if (diff.children.empty()) {
                emit_plain(fmt::format("  {}{}", indent, labelled(diff.path, repr(diff.from))));
                return;
            }
            // Unchanged subtrees only show up as context; print them whole.
            for (const auto& child : diff.children) {
                node(child, indent);
            }
            return;

        case DiffStatus::Modified:
            if (is_multiline_diff(diff)) {
                multiline(diff, indent);
                return;
            }
            if (!diff.children.empty()) {
                children(diff.children, indent);
                return;
            }
            emit(options_.colors.deleted, fmt::format("- {}{}", indent, labelled(diff.path, repr(diff.from))));
            emit(options_.colors.inserted, fmt::format("+ {}{}", indent, labelled(diff.path, repr(diff.to))));
            return;

        case DiffStatus::Deleted:
            added_or_deleted(diff.from, diff.path, indent, false);
            return;

        case DiffStatus::Added:
            added_or_deleted(diff.to, diff.path, indent, true);
            return;
    }
}

void
UnifiedWriter::children(const std::vector<DiffResult>& siblings, const std::string& indent) {
    for (const auto& slot : select_window(siblings, context_)) {
        if (slot.gap_before) {
            marker("  ", indent);
        }
        node(siblings[slot.index], indent);
    }
}

void
UnifiedWriter::multiline(const DiffResult& diff, const std::string& indent) {
    // A multiline document root has no key to head its lines.
    const bool root = diff.path.empty();
    if (!root) {
        emit_plain(fmt::format("  {}{}:", indent, display_path(diff.path)));
    }

    const auto line_indent = root ? indent : indent + "  ";
    for (const auto& slot : select_window(diff.children, context_)) {
        if (slot.gap_before) {
            marker("   ", line_indent);
        }
        line(diff.children[slot.index], line_indent);
    }
}

void
UnifiedWriter::line(const DiffResult& diff, const std::string& indent) {
    auto text = [](const ValuePtr& value) { return value && value->is_string() ? value->as_string() : repr(value); };

    switch (diff.status) {
        case DiffStatus::Same:
            emit_plain(fmt::format("   {}{}", indent, text(diff.from)));
            break;
        case DiffStatus::Deleted:
            emit(options_.colors.deleted, fmt::format("-  {}{}", indent, text(diff.from)));
            break;
        case DiffStatus::Added:
            emit(options_.colors.inserted, fmt::format("+  {}{}", indent, text(diff.to)));
            break;
        case DiffStatus::Modified:
            emit(options_.colors.deleted, fmt::format("-  {}{}", indent, text(diff.from)));
            emit(options_.colors.inserted, fmt::format("+  {}{}", indent, text(diff.to)));
            break;
    }
}

void
UnifiedWriter::added_or_deleted(const ValuePtr& value, const Path& path, const std::string& indent, bool added) {
    const auto& style = added ? options_.colors.inserted : options_.colors.deleted;
    const char* prefix = added ? "+ " : "- ";

    if (value && (value->is_object() || value->is_array()) && value->well_formed()) {
        if (path.empty()) {
            structure(value, indent + " ", added);
            return;
        }
        emit(style, fmt::format("{}{}{}:", prefix, indent, display_path(path)));
        structure(value, indent + "  ", added);
        return;
    }

    emit(style, fmt::format("{}{}{}", prefix, indent, labelled(path, repr(value))));
}

// Whole subtree of an added or deleted container, keys in source order.
void
UnifiedWriter::structure(const ValuePtr& value, const std::string& indent, bool added) {
    const auto& style = added ? options_.colors.inserted : options_.colors.deleted;
    const char* prefix = added ? "+ " : "- ";

    auto entry = [&](const std::string& label, const ValuePtr& child) {
        if (child && child->well_formed() && (child->is_object() || child->is_array())) {
            emit(style, fmt::format("{}{}{}:", prefix, indent, label));
            structure(child, indent + "  ", added);
        } else {
            emit(style, fmt::format("{}{}{}: {}", prefix, indent, label, repr(child)));
        }
    };

    if (const auto* fields = value->object_if()) {
        fields->for_each(entry);
    } else if (const auto* elements = value->array_if()) {
        for (std::size_t i = 0; i < elements->size(); i++) {
            entry(index_segment(i), (*elements)[i]);
        }
    }
}

}  // namespace

std::vector<std::string>
nestdiff::unified_diff_render(gsl::span<const DiffResult> results, const UnifiedOptions& options) {
    UnifiedWriter writer(options);

    // Unchanged documents are only spelled out in show-all mode. Skipping
    // any between two printed documents leaves a marker.
    bool first = true;
    bool skipped = false;
    for (const auto& result : results) {
        if (!options.show_all && !has_changed_descendants(result)) {
            skipped = true;
            continue;
        }
        if (!first) {
            writer.separator();
            if (skipped) {
                writer.marker("  ", "");
            }
        }
        writer.document(result);
        first = false;
        skipped = false;
    }

    return writer.take();
}
