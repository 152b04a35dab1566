#pragma once

/*
    Tokenizer for the conf language. It tags the in-between token data as
    strings, integers, floats, booleans and identifiers, which keeps the
    parser state machine small.

    Whitespace and newlines are dropped, quotes are stripped from string
    tokens and escape sequences in double quoted strings are resolved, so a
    token's text is not always a substring of the input.
*/

#include "parser/parse_result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace nestdiff {
namespace conf_tokenizer {

using TokenId = std::uint32_t;
// clang-format off
const TokenId TokenId_OpenBracket  = 1 << 0;
const TokenId TokenId_CloseBracket = 1 << 1;
const TokenId TokenId_Assign       = 1 << 2;
const TokenId TokenId_OpenCurly    = 1 << 3;
const TokenId TokenId_CloseCurly   = 1 << 4;
const TokenId TokenId_Comma        = 1 << 5;
const TokenId TokenId_Boolean      = 1 << 6;
const TokenId TokenId_Integer      = 1 << 7;
const TokenId TokenId_Float        = 1 << 8;
const TokenId TokenId_String       = 1 << 9;
const TokenId TokenId_Identifier   = 1 << 10;
const TokenId TokenId_Comment      = 1 << 11;
const TokenId TokenId_Terminator   = 1 << 12;

const TokenId TokenId_FirstOnLine  = 1 << 13; // Only whitespace before this token

const TokenId TokenId_MetaKey    = TokenId_Identifier | TokenId_String;
const TokenId TokenId_MetaValue  = TokenId_Boolean | TokenId_Integer | TokenId_Float | TokenId_String | TokenId_Identifier;
const TokenId TokenId_MetaObject = TokenId_OpenCurly | TokenId_OpenBracket | TokenId_MetaValue;
// clang-format on

struct Token {
    std::string text;

    std::size_t line = 0;
    std::size_t column = 0;

    TokenId id = 0;

    bool token_boolean_arg = false;
    int64_t token_int_arg = 0;
    double token_float_arg = 0.0;
};

// The token list always ends with a TokenId_Terminator token.
bool
tokenize(const std::string& text, std::vector<Token>& tokens, ParseResult& result);

std::string
repr(TokenId id);

}  // namespace conf_tokenizer
}  // namespace nestdiff
