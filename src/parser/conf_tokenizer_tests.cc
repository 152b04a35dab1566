#include "parser/conf_tokenizer.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace nestdiff;
using namespace nestdiff::conf_tokenizer;

namespace {

std::vector<Token>
tokens_of(const std::string& text) {
    std::vector<Token> tokens;
    ParseResult result;
    REQUIRE(tokenize(text, tokens, result));
    REQUIRE(result.is_ok());
    return tokens;
}

bool
has(const Token& token, TokenId id) {
    return (token.id & id) == id;
}

}  // namespace

TEST_CASE("conf tokenizer") {
    SUBCASE("empty") {
        auto a = tokens_of("");
        REQUIRE(a.size() == 1);
        REQUIRE(has(a[0], TokenId_Terminator));
    }

    SUBCASE("just newlines and spaces") {
        auto a = tokens_of("   \n \t \n");
        REQUIRE(a.size() == 1);
        REQUIRE(a[0].line == 3);
    }

    SUBCASE("punctuation") {
        auto a = tokens_of("{}[]=,");
        REQUIRE(a.size() == 7);
        REQUIRE(has(a[0], TokenId_OpenCurly));
        REQUIRE(has(a[1], TokenId_CloseCurly));
        REQUIRE(has(a[2], TokenId_OpenBracket));
        REQUIRE(has(a[3], TokenId_CloseBracket));
        REQUIRE(has(a[4], TokenId_Assign));
        REQUIRE(has(a[5], TokenId_Comma));
        REQUIRE(has(a[6], TokenId_Terminator));
    }

    SUBCASE("scalars") {
        auto a = tokens_of("true false 42 -7 1.5 1e3 name +3");
        REQUIRE(a.size() == 9);

        REQUIRE(has(a[0], TokenId_Boolean));
        REQUIRE(a[0].token_boolean_arg);
        REQUIRE(has(a[1], TokenId_Boolean));
        REQUIRE_FALSE(a[1].token_boolean_arg);

        REQUIRE(has(a[2], TokenId_Integer));
        REQUIRE(a[2].token_int_arg == 42);
        REQUIRE(has(a[3], TokenId_Integer));
        REQUIRE(a[3].token_int_arg == -7);

        REQUIRE(has(a[4], TokenId_Float));
        REQUIRE(a[4].token_float_arg == doctest::Approx(1.5));
        REQUIRE(has(a[5], TokenId_Float));
        REQUIRE(a[5].token_float_arg == doctest::Approx(1000.0));

        REQUIRE(has(a[6], TokenId_Identifier));
        REQUIRE(a[6].text == "name");

        // No leading plus on integers.
        REQUIRE(has(a[7], TokenId_Float));
        REQUIRE(a[7].token_float_arg == doctest::Approx(3.0));
    }

    SUBCASE("strings") {
        auto a = tokens_of(R"("a \"b\"\n" 'c \n d')");
        REQUIRE(a.size() == 3);
        REQUIRE(has(a[0], TokenId_String));
        REQUIRE(a[0].text == "a \"b\"\n");
        REQUIRE(has(a[1], TokenId_String));
        REQUIRE(a[1].text == R"(c \n d)");
    }

    SUBCASE("triple quoted strings span lines") {
        auto a = tokens_of("x = '''\nfirst\nsecond'''\ny = 1");
        REQUIRE(a.size() == 7);
        REQUIRE(a[2].text == "first\nsecond");
        REQUIRE(a[3].text == "y");
        REQUIRE(a[3].line == 4);
        REQUIRE(has(a[3], TokenId_FirstOnLine));
    }

    SUBCASE("comments") {
        auto a = tokens_of("# top\nkey = 1 // trailing\n");
        REQUIRE(a.size() == 6);
        REQUIRE(has(a[0], TokenId_Comment));
        REQUIRE(a[0].text == "top");
        REQUIRE(has(a[4], TokenId_Comment));
        REQUIRE(a[4].text == "trailing");
    }

    SUBCASE("positions") {
        auto a = tokens_of("[general]\n  context = 5");
        REQUIRE(a[1].text == "general");
        REQUIRE(a[1].line == 1);
        REQUIRE(a[1].column == 2);
        REQUIRE(a[3].text == "context");
        REQUIRE(a[3].line == 2);
        REQUIRE(a[3].column == 3);
        REQUIRE(has(a[3], TokenId_FirstOnLine));
        REQUIRE_FALSE(has(a[4], TokenId_FirstOnLine));
    }

    SUBCASE("unterminated string") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE_FALSE(tokenize("key = 'abc\nnext = 1", tokens, result));
        REQUIRE(result.kind == ParseErrorKind::Tokenization);
        REQUIRE(result.error == "Unterminated string at line 1 column 7");
    }

    SUBCASE("stray slash") {
        std::vector<Token> tokens;
        ParseResult result;
        REQUIRE_FALSE(tokenize("key = /x", tokens, result));
        REQUIRE(result.kind == ParseErrorKind::Tokenization);
    }
}
