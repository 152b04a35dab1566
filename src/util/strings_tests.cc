#include "util/strings.hpp"

#include <doctest.h>

using namespace nestdiff;

TEST_CASE("strings") {
    SUBCASE("case folding") {
        REQUIRE(to_lower_ascii("MixedCase-42") == "mixedcase-42");
        REQUIRE(to_lower_ascii("\xc3\x84") == "\xc3\x84");
        REQUIRE(iequals_ascii("Kind", "kIND"));
        REQUIRE_FALSE(iequals_ascii("Kind", "Kinds"));
    }

    SUBCASE("split lines") {
        REQUIRE(split_lines("") == std::vector<std::string>{""});
        REQUIRE(split_lines("a") == std::vector<std::string>{"a"});
        REQUIRE(split_lines("a\nb\n") == std::vector<std::string>{"a", "b", ""});
        REQUIRE(split_lines("\n\n") == std::vector<std::string>{"", "", ""});
    }

    SUBCASE("join") {
        REQUIRE(join({}, ".") == "");
        REQUIRE(join({"a", "[0]", "b"}, ".") == "a.[0].b");
    }

    SUBCASE("json quote") {
        REQUIRE(json_quote("plain") == R"("plain")");
        REQUIRE(json_quote("a\"b\\c") == R"("a\"b\\c")");
        REQUIRE(json_quote("tab\tnew\n") == R"("tab\tnew\n")");
        REQUIRE(json_quote(std::string(1, '\x01')) == R"("\u0001")");
    }

    SUBCASE("trim") {
        REQUIRE(trim("  a b \t\r\n") == "a b");
        REQUIRE(trim(" \n ").empty());
    }
}
