#include "output/json_patch.hpp"

#include "compare/comparator.hpp"

#include <doctest.h>

using namespace nestdiff;

namespace {

std::vector<std::string>
operations(const ValuePtr& a, const ValuePtr& b, ArrayStrategy strategy = ArrayStrategy::kValue) {
    DiffOptions options;
    options.array_strategy = strategy;
    const std::vector<DiffResult> results{Comparator{options}.compare(a, b)};
    return json_patch_operations(results);
}

using Lines = std::vector<std::string>;

}  // namespace

TEST_CASE("json pointer") {
    REQUIRE(json_pointer({}) == "");
    REQUIRE(json_pointer({"a"}) == "/a");
    REQUIRE(json_pointer({"a", "[0]", "b/c"}) == "/a/0/b~1c");
    REQUIRE(json_pointer({"m~n"}) == "/m~0n");
    REQUIRE(json_pointer({"[x]"}) == "/[x]");
    REQUIRE(json_pointer({""}) == "/");
}

TEST_CASE("json patch") {
    SUBCASE("replace, remove and add") {
        auto a = make_object(Value::Object{{"a", make_int(1)}, {"b", make_int(2)}, {"d/e", make_int(1)}});
        auto b = make_object(Value::Object{{"a", make_int(2)}, {"d/e", make_int(3)}, {"f", make_array({make_bool(true)})}});

        REQUIRE(operations(a, b) == Lines{
                                        R"({"op": "replace", "path": "/a", "value": 2})",
                                        R"({"op": "remove", "path": "/b"})",
                                        R"({"op": "replace", "path": "/d~1e", "value": 3})",
                                        R"({"op": "add", "path": "/f", "value": [true]})",
                                    });
    }

    SUBCASE("array elements") {
        auto a = make_object(Value::Object{{"c", make_array({make_int(1), make_int(2)})}});
        auto b = make_object(Value::Object{{"c", make_array({make_int(1), make_int(5)})}});

        REQUIRE(operations(a, b, ArrayStrategy::kIndex) == Lines{R"({"op": "replace", "path": "/c/1", "value": 5})"});
    }

    SUBCASE("multiline string is replaced whole") {
        auto a = make_object(Value::Object{{"s", make_string("a\nb\nc")}});
        auto b = make_object(Value::Object{{"s", make_string("a\nX\nc")}});

        REQUIRE(operations(a, b) == Lines{R"({"op": "replace", "path": "/s", "value": "a\nX\nc"})"});
    }

    SUBCASE("type change at the root") {
        REQUIRE(operations(make_string("1"), make_int(1)) == Lines{R"({"op": "replace", "path": "", "value": 1})"});
    }

    SUBCASE("added object keeps its fields") {
        auto a = make_object(Value::Object{});
        auto b = make_object(Value::Object{{"meta", make_object(Value::Object{{"x", make_null()}, {"y", make_string("z")}})}});

        REQUIRE(operations(a, b) == Lines{R"({"op": "add", "path": "/meta", "value": {"x": null, "y": "z"}})"});
    }
}

TEST_CASE("json patch document") {
    const Comparator comparator{DiffOptions{}};

    SUBCASE("no changes") {
        const std::vector<DiffResult> results{comparator.compare(make_int(1), make_int(1))};
        REQUIRE(json_patch_render(results) == Lines{"[]"});
        REQUIRE(json_patch_render({}) == Lines{"[]"});
    }

    SUBCASE("one operation per line") {
        auto a = make_object(Value::Object{{"a", make_int(1)}, {"b", make_int(2)}});
        auto b = make_object(Value::Object{{"a", make_int(3)}});
        const std::vector<DiffResult> results{comparator.compare(a, b)};

        REQUIRE(json_patch_render(results) == Lines{
                                                  "[",
                                                  R"(  {"op": "replace", "path": "/a", "value": 3},)",
                                                  R"(  {"op": "remove", "path": "/b"})",
                                                  "]",
                                              });
    }
}
