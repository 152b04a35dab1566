#include "compare/comparator.hpp"

#include "compare/array_matcher.hpp"
#include "compare/multiline.hpp"
#include "util/strings.hpp"

#include <map>
#include <tuple>

using namespace nestdiff;

namespace {

// Maps an object key to the slot it is compared in.
using KeyFold = std::string (*)(std::string_view);

std::string
exact_key(std::string_view key) {
    return std::string{key};
}

std::string
folded_key(std::string_view key) {
    return to_lower_ascii(key);
}

// One row of an object comparison. `label` is the key shown in the path.
struct KeySlot {
    std::string label;
    ValuePtr a;
    ValuePtr b;
    bool has_a = false;
    bool has_b = false;
};

// Slots sort by folded key. A key that folds onto a slot its own side has
// already filled gets an overflow slot named by its exact spelling, sorted
// right after the primary one. Without case folding this never happens.
using SlotKey = std::tuple<std::string, bool, std::string>;

bool
is_multiline(const Value& value) {
    const auto* s = value.string_if();
    return s && s->find('\n') != std::string::npos;
}

}  // namespace

DiffResult
Comparator::compare(const ValuePtr& a, const ValuePtr& b) const {
    return compare_at(a, b, {});
}

bool
Comparator::strings_equal(const std::string& a, const std::string& b) const {
    if (options_.ignore_value_case) {
        return iequals_ascii(a, b);
    }
    return a == b;
}

DiffResult
Comparator::compare_at(const ValuePtr& a, const ValuePtr& b, const Path& path) const {
    if (!a && !b) {
        return make_diff(DiffStatus::Same, path, nullptr, nullptr, 0);
    }

    if (!a) {
        return make_diff(DiffStatus::Added, path, nullptr, b, leaf_count(b));
    }

    if (!b) {
        return make_diff(DiffStatus::Deleted, path, a, nullptr, leaf_count(a));
    }

    // No partial matching across types. A payload that disagrees with its
    // tag lands here as well.
    if (a->type != b->type || !a->well_formed() || !b->well_formed()) {
        return make_diff(DiffStatus::Modified, path, a, b, leaf_count(a) + leaf_count(b));
    }

    auto scalar_result = [&](bool equal) {
        if (equal) {
            return make_diff(DiffStatus::Same, path, a, b, 0);
        }
        return make_diff(DiffStatus::Modified, path, a, b, 1);
    };

    switch (a->type) {
        case ValueType::Null:
            return scalar_result(true);
        case ValueType::Bool:
            return scalar_result(a->as_bool() == b->as_bool());
        case ValueType::Number:
            return scalar_result(a->as_number() == b->as_number());
        case ValueType::String:
            if (is_multiline(*a) || is_multiline(*b)) {
                return compare_multiline_strings(*this, a, b, path);
            }
            return scalar_result(strings_equal(a->as_string(), b->as_string()));
        case ValueType::Array:
            return compare_arrays(*this, a, b, path, options_.array_strategy);
        case ValueType::Object:
            return compare_objects(a, b, path);
    }

    return make_diff(DiffStatus::Modified, path, a, b, 1);
}

DiffResult
Comparator::compare_objects(const ValuePtr& a, const ValuePtr& b, const Path& path) const {
    DiffResult result = make_diff(DiffStatus::Same, path, a, b, 0);

    const KeyFold fold = options_.ignore_key_case ? &folded_key : &exact_key;

    std::map<SlotKey, KeySlot> slots;

    // The from side is collected first, so its spelling of a key becomes the
    // label whenever it has one.
    auto collect = [&](const Value::Object& fields, bool from_side) {
        fields.for_each([&](const std::string& key, const ValuePtr& value) {
            SlotKey slot_key{fold(key), false, std::string{}};
            auto it = slots.find(slot_key);
            if (it != slots.end() && (from_side ? it->second.has_a : it->second.has_b)) {
                slot_key = SlotKey{fold(key), true, key};
            }

            KeySlot& slot = slots[slot_key];
            if (slot.label.empty() && !slot.has_a && !slot.has_b) {
                slot.label = key;
            }
            if (from_side) {
                slot.a = value;
                slot.has_a = true;
            } else {
                slot.b = value;
                slot.has_b = true;
            }
        });
    };

    collect(a->as_object(), true);
    collect(b->as_object(), false);

    for (auto& [slot_key, slot] : slots) {
        // Only skip when both sides are ignorable; a real value appearing
        // where there was nothing is still a change.
        if (should_ignore(slot.a, slot.has_a) && should_ignore(slot.b, slot.has_b)) {
            continue;
        }

        add_child(result, compare_at(slot.a, slot.b, child_path(path, slot.label)));
    }

    return result;
}

bool
Comparator::should_ignore(const ValuePtr& value, bool exists) const {
    if (!exists && options_.ignore_empty_fields) {
        return true;
    }

    if (!options_.ignore_zero_values) {
        return false;
    }

    if (!value) {
        return true;
    }

    return is_zero_value(*value);
}
