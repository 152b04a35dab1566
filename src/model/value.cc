#include "model/value.hpp"

#include "util/strings.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

using namespace nestdiff;

Number
Number::from_int(int64_t value) {
    Number n;
    n.kind = Kind::Int;
    n.i = value;
    return n;
}

Number
Number::from_uint(uint64_t value) {
    Number n;
    n.kind = Kind::UInt;
    n.u = value;
    return n;
}

Number
Number::from_float(double value) {
    Number n;
    n.kind = Kind::Float;
    n.f = value;
    return n;
}

std::optional<int64_t>
Number::as_integral() const {
    switch (kind) {
        case Kind::Int:
            return i;
        case Kind::UInt:
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(u);
            }
            return std::nullopt;
        case Kind::Float: {
            // [-2^63, 2^63) is exactly representable as a double range.
            constexpr double lower = -9223372036854775808.0;
            constexpr double upper = 9223372036854775808.0;
            if (std::isfinite(f) && f >= lower && f < upper && std::trunc(f) == f) {
                return static_cast<int64_t>(f);
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

double
Number::as_double() const {
    switch (kind) {
        case Kind::Int:
            return static_cast<double>(i);
        case Kind::UInt:
            return static_cast<double>(u);
        case Kind::Float:
            return f;
    }
    return 0.0;
}

bool
Number::is_zero() const {
    return as_double() == 0.0;
}

namespace {

// The value as an exact uint64 when it lies in [2^63, 2^64), where int64
// has no room for it.
std::optional<uint64_t>
above_int64(const Number& n) {
    switch (n.kind) {
        case Number::Kind::Int:
            return std::nullopt;
        case Number::Kind::UInt:
            if (n.u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return n.u;
            }
            return std::nullopt;
        case Number::Kind::Float: {
            constexpr double lower = 9223372036854775808.0;
            constexpr double upper = 18446744073709551616.0;
            if (n.f >= lower && n.f < upper && std::trunc(n.f) == n.f) {
                return static_cast<uint64_t>(n.f);
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

}  // namespace

bool
Number::operator==(const Number& other) const {
    if (kind == Kind::UInt && other.kind == Kind::UInt) {
        return u == other.u;
    }

    auto big_a = above_int64(*this);
    auto big_b = above_int64(other);
    if (big_a || big_b) {
        return big_a && big_b && *big_a == *big_b;
    }

    auto a = as_integral();
    auto b = other.as_integral();
    if (a && b) {
        return *a == *b;
    }
    return as_double() == other.as_double();
}

bool
Value::well_formed() const {
    switch (type) {
        case ValueType::Null:
            return std::holds_alternative<std::monostate>(v);
        case ValueType::Bool:
            return std::holds_alternative<bool>(v);
        case ValueType::Number:
            return std::holds_alternative<Number>(v);
        case ValueType::String:
            return std::holds_alternative<std::string>(v);
        case ValueType::Array:
            return std::holds_alternative<Array>(v);
        case ValueType::Object:
            return std::holds_alternative<Object>(v);
    }
    return false;
}

namespace {

ValuePtr
make_value(ValueType type, Value::Payload payload, Metadata meta) {
    auto value = std::make_shared<Value>();
    value->type = type;
    value->v = std::move(payload);
    value->meta = std::move(meta);
    return value;
}

std::string
json_number(const Number& number) {
    if (number.kind == Number::Kind::Float && !std::isfinite(number.f)) {
        return "null";
    }
    return repr(number);
}

}  // namespace

ValuePtr
nestdiff::make_null(Metadata meta) {
    return make_value(ValueType::Null, std::monostate{}, std::move(meta));
}

ValuePtr
nestdiff::make_bool(bool value, Metadata meta) {
    return make_value(ValueType::Bool, value, std::move(meta));
}

ValuePtr
nestdiff::make_int(int64_t value, Metadata meta) {
    return make_value(ValueType::Number, Number::from_int(value), std::move(meta));
}

ValuePtr
nestdiff::make_uint(uint64_t value, Metadata meta) {
    return make_value(ValueType::Number, Number::from_uint(value), std::move(meta));
}

ValuePtr
nestdiff::make_float(double value, Metadata meta) {
    return make_value(ValueType::Number, Number::from_float(value), std::move(meta));
}

ValuePtr
nestdiff::make_string(std::string value, Metadata meta) {
    return make_value(ValueType::String, std::move(value), std::move(meta));
}

ValuePtr
nestdiff::make_array(Value::Array elements, Metadata meta) {
    return make_value(ValueType::Array, std::move(elements), std::move(meta));
}

ValuePtr
nestdiff::make_object(Value::Object fields, Metadata meta) {
    return make_value(ValueType::Object, std::move(fields), std::move(meta));
}

ValuePtr
nestdiff::find_field(const ValuePtr& value, const std::string& key) {
    if (!value) {
        return nullptr;
    }
    const auto* object = value->object_if();
    if (!object) {
        return nullptr;
    }
    const auto* field = object->find(key);
    return field ? *field : nullptr;
}

int64_t
nestdiff::leaf_count(const ValuePtr& value) {
    if (!value) {
        return 0;
    }

    if (const auto* elements = value->array_if(); elements && value->is_array()) {
        int64_t size = 0;
        for (const auto& element : *elements) {
            size += leaf_count(element);
        }
        return size;
    }

    if (const auto* fields = value->object_if(); fields && value->is_object()) {
        int64_t size = 0;
        fields->for_each([&](const std::string&, const ValuePtr& field) { size += leaf_count(field); });
        return size;
    }

    // Scalars, and anything whose payload disagrees with its tag.
    return 1;
}

bool
nestdiff::is_zero_value(const Value& value) {
    if (!value.well_formed()) {
        return false;
    }

    switch (value.type) {
        case ValueType::Null:
            return true;
        case ValueType::Bool:
            return !value.as_bool();
        case ValueType::Number:
            return value.as_number().is_zero();
        case ValueType::String:
            return value.as_string().empty();
        case ValueType::Array:
            return value.as_array().empty();
        case ValueType::Object:
            return value.as_object().empty();
    }
    return false;
}

std::string
nestdiff::repr(ValueType type) {
    switch (type) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return "bool";
        case ValueType::Number:
            return "number";
        case ValueType::String:
            return "string";
        case ValueType::Array:
            return "array";
        case ValueType::Object:
            return "object";
    }
    return "unknown";
}

std::string
nestdiff::repr(const Number& number) {
    switch (number.kind) {
        case Number::Kind::Int:
            return fmt::format("{}", number.i);
        case Number::Kind::UInt:
            return fmt::format("{}", number.u);
        case Number::Kind::Float:
            return fmt::format("{}", number.f);
    }
    return "0";
}

std::string
nestdiff::repr(const ValuePtr& value) {
    if (!value || !value->well_formed()) {
        return "null";
    }

    switch (value->type) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return value->as_bool() ? "true" : "false";
        case ValueType::Number:
            return repr(value->as_number());
        case ValueType::String:
            return value->as_string();
        case ValueType::Array: {
            const auto& elements = value->as_array();
            if (elements.empty()) {
                return "[]";
            }
            return fmt::format("[{} items]", elements.size());
        }
        case ValueType::Object: {
            const auto& fields = value->as_object();
            if (fields.empty()) {
                return "{}";
            }
            return fmt::format("{{{} fields}}", fields.size());
        }
    }
    return "?";
}

std::string
nestdiff::to_json(const ValuePtr& value) {
    if (!value || !value->well_formed()) {
        return "null";
    }

    switch (value->type) {
        case ValueType::Null:
            return "null";
        case ValueType::Bool:
            return value->as_bool() ? "true" : "false";
        case ValueType::Number:
            return json_number(value->as_number());
        case ValueType::String:
            return json_quote(value->as_string());
        case ValueType::Array: {
            std::vector<std::string> elements;
            for (const auto& element : value->as_array()) {
                elements.push_back(to_json(element));
            }
            return fmt::format("[{}]", join(elements, ", "));
        }
        case ValueType::Object: {
            std::vector<std::string> fields;
            value->as_object().for_each([&](const std::string& key, const ValuePtr& field) {
                fields.push_back(fmt::format("{}: {}", json_quote(key), to_json(field)));
            });
            return fmt::format("{{{}}}", join(fields, ", "));
        }
    }
    return "null";
}
