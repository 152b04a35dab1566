#include "compare/multiline.hpp"

#include <doctest.h>

using namespace nestdiff;

TEST_CASE("multiline strings") {
    const Comparator comparator{DiffOptions{}};

    SUBCASE("single changed line") {
        auto diff = comparator.compare(make_string("a\nb\nc"), make_string("a\nX\nc"));

        REQUIRE(diff.status == DiffStatus::Modified);
        REQUIRE(diff.meta.diff_count == 1);
        REQUIRE(diff.from->as_string() == "a\nb\nc");
        REQUIRE(diff.to->as_string() == "a\nX\nc");
        REQUIRE(diff.children.size() == 3);

        int changed = 0;
        for (const auto& child : diff.children) {
            if (child.status != DiffStatus::Same) {
                changed++;
                REQUIRE(child.path == Path{"line 1"});
            }
        }
        REQUIRE(changed == 1);
    }

    SUBCASE("equal multiline strings have no children") {
        auto diff = comparator.compare(make_string("a\nb"), make_string("a\nb"));
        REQUIRE(diff.status == DiffStatus::Same);
        REQUIRE(diff.children.empty());
    }

    SUBCASE("one side without a line break") {
        auto diff = comparator.compare(make_string("one"), make_string("one\ntwo"));
        REQUIRE(diff.status == DiffStatus::Modified);
        REQUIRE(diff.children.size() == 2);
        REQUIRE(diff.children[0].status == DiffStatus::Same);
        REQUIRE(diff.children[1].status == DiffStatus::Added);
        REQUIRE(diff.children[1].path == Path{"line 1"});
    }

    SUBCASE("lines nest below the key") {
        auto a = make_object(Value::Object{{"script", make_string("set -e\nmake\n")}});
        auto b = make_object(Value::Object{{"script", make_string("set -e\nmake install\n")}});

        auto diff = comparator.compare(a, b);
        const auto& script = diff.children[0];
        REQUIRE(script.children.size() == 3);
        REQUIRE(script.children[1].path == Path{"script", "line 1"});
        REQUIRE(script.children[2].status == DiffStatus::Same);
    }

    SUBCASE("line order matters even with the value strategy") {
        DiffOptions options;
        options.array_strategy = ArrayStrategy::kValue;
        auto diff = Comparator{options}.compare(make_string("a\nb"), make_string("b\na"));
        REQUIRE(diff.status == DiffStatus::Modified);
        REQUIRE(diff.meta.diff_count == 2);
    }

    SUBCASE("value case applies per line") {
        DiffOptions options;
        options.ignore_value_case = true;
        auto diff = Comparator{options}.compare(make_string("A\nb"), make_string("a\nB"));
        REQUIRE(diff.status == DiffStatus::Same);
    }
}

TEST_CASE("line segment labels") {
    REQUIRE(line_segment_from_index("[0]") == "line 0");
    REQUIRE(line_segment_from_index("[12]") == "line 12");
    REQUIRE(line_segment_from_index("name") == "name");
    REQUIRE(line_segment_from_index("[") == "[");
}
