#pragma once

#include <fmt/format.h>

#include <string>
#include <utility>

namespace nestdiff {

// clang-format off
enum class ParseErrorKind {
    None         = 1 << 0,
    File         = 1 << 1, // Missing or unreadable input
    Tokenization = 1 << 2,
    Parsing      = 1 << 3,
    Format       = 1 << 4, // Unknown format name
    Other        = 1 << 5,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(ParseErrorKind error_kind, std::string message) {
        kind = error_kind;
        error = std::move(message);
    }

    void
    set_error(ParseErrorKind error_kind, std::size_t line, std::size_t column, const std::string& message) {
        kind = error_kind;
        error = fmt::format("{} at line {} column {}", message, line, column);
    }
};

std::string
repr(ParseErrorKind kind);

}  // namespace nestdiff
