#pragma once

/*
    Format-agnostic document tree.

    Every decoder (json, yaml, conf) produces these, and everything in
    compare/ and matching/ operates on them. Trees are immutable once built
    and shared through ValuePtr.

    The type tag and the payload are stored separately. Decoders always keep
    them in agreement, but the comparator treats a disagreeing pair as a
    type mismatch instead of trusting the tag.
*/

#include "util/ordered_map.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nestdiff {

enum class ValueType {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
};

// YAML scalar presentation
enum class StringStyle {
    Unknown,
    Quoted,   // "string" or 'string'
    Literal,  // |
    Folded,   // >
    Plain,    // no quotes
};

struct Location {
    int line = 0;
    int column = 0;
};

// Provenance only; never consulted when comparing.
struct Metadata {
    std::string format;
    StringStyle string_style = StringStyle::Unknown;
    std::optional<Location> location;
};

struct Number {
    enum class Kind : uint8_t {
        Int,
        UInt,
        Float,
    };

    Kind kind = Kind::Int;
    int64_t i = 0;
    uint64_t u = 0;
    double f = 0.0;

    static Number
    from_int(int64_t value);

    static Number
    from_uint(uint64_t value);

    static Number
    from_float(double value);

    // The value as an exact int64 when it has one; uints above INT64_MAX and
    // fractional or out of range floats have none.
    std::optional<int64_t>
    as_integral() const;

    double
    as_double() const;

    bool
    is_zero() const;

    // Integral on both sides, including uints above INT64_MAX: exact comparison.
    // Otherwise: double comparison.
    bool
    operator==(const Number& other) const;

    bool
    operator!=(const Number& other) const {
        return !(*this == other);
    }
};

struct Value;
using ValuePtr = std::shared_ptr<const Value>;

struct Value {
    using Array = std::vector<ValuePtr>;
    using Object = OrderedMap<std::string, ValuePtr>;
    using Payload = std::variant<std::monostate, bool, Number, std::string, Array, Object>;

    ValueType type = ValueType::Null;
    Payload v;
    Metadata meta;

    // True when the payload alternative agrees with the type tag.
    bool
    well_formed() const;

    // clang-format off
    bool is_null() const { return type == ValueType::Null; }
    bool is_bool() const { return type == ValueType::Bool; }
    bool is_number() const { return type == ValueType::Number; }
    bool is_string() const { return type == ValueType::String; }
    bool is_array() const { return type == ValueType::Array; }
    bool is_object() const { return type == ValueType::Object; }

    const bool* bool_if() const { return std::get_if<bool>(&v); }
    const Number* number_if() const { return std::get_if<Number>(&v); }
    const std::string* string_if() const { return std::get_if<std::string>(&v); }
    const Array* array_if() const { return std::get_if<Array>(&v); }
    const Object* object_if() const { return std::get_if<Object>(&v); }

    bool as_bool() const { return std::get<bool>(v); }
    const Number& as_number() const { return std::get<Number>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const Array& as_array() const { return std::get<Array>(v); }
    const Object& as_object() const { return std::get<Object>(v); }
    // clang-format on
};

ValuePtr
make_null(Metadata meta = {});

ValuePtr
make_bool(bool value, Metadata meta = {});

ValuePtr
make_int(int64_t value, Metadata meta = {});

ValuePtr
make_uint(uint64_t value, Metadata meta = {});

ValuePtr
make_float(double value, Metadata meta = {});

ValuePtr
make_string(std::string value, Metadata meta = {});

ValuePtr
make_array(Value::Array elements, Metadata meta = {});

ValuePtr
make_object(Value::Object fields, Metadata meta = {});

// Field of an object value, or nullptr when `value` is not an object or
// has no such key.
ValuePtr
find_field(const ValuePtr& value, const std::string& key);

// Number of atomic values (scalars) in the tree. Empty containers count 0.
int64_t
leaf_count(const ValuePtr& value);

// null, false, 0, "", [] and {}
bool
is_zero_value(const Value& value);

std::string
repr(ValueType type);

std::string
repr(const Number& number);

// Short display form: scalars as text, containers as a summary.
std::string
repr(const ValuePtr& value);

// Compact JSON text of the whole tree, object keys in source order.
std::string
to_json(const ValuePtr& value);

}  // namespace nestdiff
