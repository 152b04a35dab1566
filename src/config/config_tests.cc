#include "config/config.hpp"

#include <doctest.h>

using namespace nestdiff;

TEST_CASE("config") {
    ProgramOptions options;
    ParseResult result;

    SUBCASE("general settings") {
        const auto text = R"(
# nestdiff.conf
[general]
context_lines = 7
show_all = true
array_strategy = "index"
output_format = "json-patch"
color = "never"
ignore_empty = true
ignore_zero_values = true
ignore_key_case = true
ignore_value_case = true
)";
        REQUIRE(config_apply_text(text, options, result));
        REQUIRE(result.is_ok());

        REQUIRE(options.context_lines == 7);
        REQUIRE(options.show_all);
        REQUIRE(options.diff.array_strategy == ArrayStrategy::kIndex);
        REQUIRE(options.output == OutputFormat::kJsonPatch);
        REQUIRE(options.color == ColorMode::kNever);
        REQUIRE(options.diff.ignore_empty_fields);
        REQUIRE(options.diff.ignore_zero_values);
        REQUIRE(options.diff.ignore_key_case);
        REQUIRE(options.diff.ignore_value_case);
    }

    SUBCASE("empty file keeps defaults") {
        REQUIRE(config_apply_text("", options, result));
        REQUIRE(options.context_lines == 3);
        REQUIRE_FALSE(options.show_all);
        REQUIRE(options.diff.array_strategy == ArrayStrategy::kValue);
        REQUIRE(options.output == OutputFormat::kUnified);
        REQUIRE(options.color == ColorMode::kAuto);
    }

    SUBCASE("bad values are skipped") {
        const auto text = R"(
[general]
context_lines = "many"
show_all = 1
array_strategy = "sideways"
color = "sometimes"
ignore_key_case = true
)";
        REQUIRE(config_apply_text(text, options, result));
        REQUIRE(options.context_lines == 3);
        REQUIRE_FALSE(options.show_all);
        REQUIRE(options.diff.array_strategy == ArrayStrategy::kValue);
        REQUIRE(options.color == ColorMode::kAuto);
        REQUIRE(options.diff.ignore_key_case);
    }

    SUBCASE("unknown keys and sections are ignored") {
        REQUIRE(config_apply_text("[diff]\nmode = 'fast'\n[general]\nunknown = 1\n", options, result));
        REQUIRE(options.context_lines == 3);
    }

    SUBCASE("syntax error") {
        REQUIRE_FALSE(config_apply_text("[general]\ncontext_lines 5\n", options, result));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(options.context_lines == 3);
    }

    SUBCASE("colors") {
        REQUIRE(config_apply_text("[colors]\ndelete = 'light_red'\nmarker = 'cyan'\ninsert = 'mauve'\n", options, result));
        REQUIRE(options.colors.deleted.fg == TermColor::kLightRed);
        REQUIRE(options.colors.marker.fg == TermColor::kCyan);
        REQUIRE(options.colors.marker.attr == TermStyle::Attribute::Dim);
        REQUIRE(options.colors.inserted.fg == TermColor::kGreen);
    }

    SUBCASE("not a table") {
        REQUIRE_FALSE(config_apply_text("[1, 2]", options, result));
        REQUIRE(result.error == "expected a table of settings");
    }
}

TEST_CASE("option names") {
    REQUIRE(output_format_from_string("unified") == OutputFormat::kUnified);
    REQUIRE(output_format_from_string("j") == OutputFormat::kJsonPatch);
    REQUIRE(output_format_from_string("side-by-side") == OutputFormat::kInvalid);
    REQUIRE(repr(OutputFormat::kJsonPatch) == "json-patch");

    REQUIRE(color_mode_from_string("always") == ColorMode::kAlways);
    REQUIRE(color_mode_from_string("off") == ColorMode::kNever);
    REQUIRE(color_mode_from_string("auto") == ColorMode::kAuto);
    REQUIRE(color_mode_from_string("rainbow") == ColorMode::kInvalid);

    REQUIRE(array_strategy_from_string("index") == ArrayStrategy::kIndex);
    REQUIRE(array_strategy_from_string("value") == ArrayStrategy::kValue);
    REQUIRE(array_strategy_from_string("order") == ArrayStrategy::kInvalid);
}
