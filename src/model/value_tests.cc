#include "model/value.hpp"

#include <doctest.h>

#include <cmath>
#include <limits>

using namespace nestdiff;

TEST_CASE("number") {
    SUBCASE("integral values compare exactly across kinds") {
        REQUIRE(Number::from_int(42) == Number::from_float(42.0));
        REQUIRE(Number::from_uint(42) == Number::from_int(42));
        REQUIRE(Number::from_int(-1) != Number::from_uint(1));
    }

    SUBCASE("fractional values compare as doubles") {
        REQUIRE(Number::from_float(0.5) == Number::from_float(0.5));
        REQUIRE(Number::from_float(0.5) != Number::from_int(0));
    }

    SUBCASE("large unsigned values") {
        const uint64_t big = std::numeric_limits<uint64_t>::max();
        REQUIRE(Number::from_uint(big) == Number::from_uint(big));
        REQUIRE(Number::from_uint(big) != Number::from_uint(big - 1));
        REQUIRE_FALSE(Number::from_uint(big).as_integral().has_value());
    }

    SUBCASE("values around 2^63 stay distinct") {
        const int64_t int_max = std::numeric_limits<int64_t>::max();
        const uint64_t two_63 = uint64_t{1} << 63;
        REQUIRE(Number::from_int(int_max) != Number::from_uint(two_63));
        REQUIRE(Number::from_uint(two_63) != Number::from_int(int_max));
        REQUIRE(Number::from_int(int_max) != Number::from_float(9223372036854775808.0));
        REQUIRE(Number::from_uint(two_63) == Number::from_float(9223372036854775808.0));
        REQUIRE(Number::from_float(9223372036854775808.0) == Number::from_uint(two_63));
        REQUIRE(Number::from_uint(two_63 + 1) != Number::from_uint(two_63));
        REQUIRE(Number::from_uint(two_63) != Number::from_float(1e30));
        REQUIRE(Number::from_uint(two_63) != Number::from_int(std::numeric_limits<int64_t>::min()));
    }

    SUBCASE("as_integral") {
        REQUIRE(Number::from_float(3.0).as_integral() == 3);
        REQUIRE_FALSE(Number::from_float(3.5).as_integral().has_value());
        REQUIRE_FALSE(Number::from_float(std::nan("")).as_integral().has_value());
    }
}

TEST_CASE("value") {
    auto doc = make_object(Value::Object{
        {"name", make_string("web")},
        {"ports", make_array({make_int(80), make_int(443)})},
        {"labels", make_object({})},
        {"enabled", make_bool(true)},
    });

    SUBCASE("leaf_count") {
        REQUIRE(leaf_count(nullptr) == 0);
        REQUIRE(leaf_count(make_null()) == 1);
        REQUIRE(leaf_count(make_array({})) == 0);
        REQUIRE(leaf_count(doc) == 4);
    }

    SUBCASE("is_zero_value") {
        REQUIRE(is_zero_value(*make_null()));
        REQUIRE(is_zero_value(*make_bool(false)));
        REQUIRE(is_zero_value(*make_int(0)));
        REQUIRE(is_zero_value(*make_float(0.0)));
        REQUIRE(is_zero_value(*make_string("")));
        REQUIRE(is_zero_value(*make_array({})));
        REQUIRE(is_zero_value(*make_object({})));
        REQUIRE_FALSE(is_zero_value(*make_string(" ")));
        REQUIRE_FALSE(is_zero_value(*doc));
    }

    SUBCASE("find_field") {
        REQUIRE(find_field(doc, "name")->as_string() == "web");
        REQUIRE(find_field(doc, "missing") == nullptr);
        REQUIRE(find_field(make_int(1), "name") == nullptr);
        REQUIRE(find_field(nullptr, "name") == nullptr);
    }

    SUBCASE("repr") {
        REQUIRE(repr(ValuePtr{}) == "null");
        REQUIRE(repr(make_int(-7)) == "-7");
        REQUIRE(repr(make_bool(false)) == "false");
        REQUIRE(repr(make_string("text")) == "text");
        REQUIRE(repr(make_array({})) == "[]");
        REQUIRE(repr(find_field(doc, "ports")) == "[2 items]");
        REQUIRE(repr(make_object({})) == "{}");
        REQUIRE(repr(doc) == "{4 fields}");
    }

    SUBCASE("to_json keeps insertion order") {
        REQUIRE(to_json(doc) == R"({"name": "web", "ports": [80, 443], "labels": {}, "enabled": true})");
        REQUIRE(to_json(make_string("a\"b\n")) == R"("a\"b\n")");
    }

    SUBCASE("well_formed") {
        REQUIRE(doc->well_formed());

        Value broken;
        broken.type = ValueType::String;
        broken.v = true;
        REQUIRE_FALSE(broken.well_formed());
    }
}
