#include "parser/conf_tokenizer.hpp"

#include "util/strings.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <tuple>
#include <vector>

using namespace nestdiff;
using namespace nestdiff::conf_tokenizer;

namespace {

bool
is_delimiter(char c) {
    switch (c) {
        case '[':
        case ']':
        case '{':
        case '}':
        case '=':
        case ',':
        case '#':
        case '"':
        case '\'':
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            return true;
        default:
            return false;
    }
}

TokenId
single_char_token(char c) {
    switch (c) {
        case '[':
            return TokenId_OpenBracket;
        case ']':
            return TokenId_CloseBracket;
        case '{':
            return TokenId_OpenCurly;
        case '}':
            return TokenId_CloseCurly;
        case '=':
            return TokenId_Assign;
        case ',':
            return TokenId_Comma;
        default:
            return 0;
    }
}

// Tag a bare word as boolean, integer, float or identifier.
void
classify_word(Token& token) {
    const auto& word = token.text;

    if (word == "true" || word == "false") {
        token.id |= TokenId_Boolean;
        token.token_boolean_arg = word == "true";
        return;
    }

    int64_t int_value = 0;
    auto [int_end, int_error] = std::from_chars(word.data(), word.data() + word.size(), int_value);
    const bool leading_plus = !word.empty() && word[0] == '+';
    if (!leading_plus && int_error == std::errc{} && int_end == word.data() + word.size()) {
        token.id |= TokenId_Integer;
        token.token_int_arg = int_value;
        return;
    }

    const char first = word[0];
    const bool numeric_start =
        (first >= '0' && first <= '9') || first == '-' || first == '+' || first == '.';
    if (numeric_start) {
        char* float_end = nullptr;
        const double float_value = std::strtod(word.c_str(), &float_end);
        if (float_end == word.c_str() + word.size()) {
            token.id |= TokenId_Float;
            token.token_float_arg = float_value;
            return;
        }
    }

    token.id |= TokenId_Identifier;
}

}  // namespace

bool
conf_tokenizer::tokenize(const std::string& text, std::vector<Token>& tokens, ParseResult& result) {
    tokens.clear();

    std::size_t line = 1;
    std::size_t line_start = 0;
    bool first_on_line = true;

    std::size_t i = 0;
    const std::size_t n = text.size();

    auto make_token = [&](TokenId id, std::size_t start) {
        Token token;
        token.id = id | (first_on_line ? TokenId_FirstOnLine : 0);
        token.line = line;
        token.column = start - line_start + 1;
        first_on_line = false;
        return token;
    };

    while (i < n) {
        const char c = text[i];

        if (c == '\n') {
            line++;
            line_start = i + 1;
            first_on_line = true;
            i++;
            continue;
        }

        if (is_whitespace(c)) {
            i++;
            continue;
        }

        // Comments run to the end of the line.
        if (c == '#' || (c == '/' && i + 1 < n && text[i + 1] == '/')) {
            auto token = make_token(TokenId_Comment, i);
            const std::size_t body = i + (c == '#' ? 1 : 2);
            auto end = text.find('\n', body);
            if (end == std::string::npos) {
                end = n;
            }
            token.text = trim(std::string_view(text).substr(body, end - body));
            tokens.push_back(std::move(token));
            i = end;
            continue;
        }

        if (auto id = single_char_token(c); id != 0) {
            auto token = make_token(id, i);
            token.text = std::string(1, c);
            tokens.push_back(std::move(token));
            i++;
            continue;
        }

        if (c == '"' || c == '\'') {
            auto token = make_token(TokenId_String, i);
            const bool triple = i + 2 < n && text[i + 1] == c && text[i + 2] == c;
            const std::size_t quote_len = triple ? 3 : 1;
            const bool escapes = c == '"';

            std::size_t j = i + quote_len;
            // A newline right after an opening triple quote is not part of the string.
            if (triple && j < n && text[j] == '\n') {
                j++;
                line++;
                line_start = j;
            }

            bool terminated = false;
            while (j < n) {
                const char s = text[j];
                if (s == c && (!triple || (j + 2 < n && text[j + 1] == c && text[j + 2] == c))) {
                    terminated = true;
                    break;
                }
                if (s == '\n') {
                    if (!triple) {
                        break;
                    }
                    line++;
                    line_start = j + 1;
                }
                if (escapes && s == '\\' && j + 1 < n) {
                    const char e = text[j + 1];
                    switch (e) {
                        case 'n':
                            token.text += '\n';
                            break;
                        case 't':
                            token.text += '\t';
                            break;
                        case 'r':
                            token.text += '\r';
                            break;
                        case '"':
                        case '\\':
                        case '/':
                            token.text += e;
                            break;
                        default:
                            token.text += s;
                            token.text += e;
                            break;
                    }
                    j += 2;
                    continue;
                }
                token.text += s;
                j++;
            }

            if (!terminated) {
                result.set_error(ParseErrorKind::Tokenization, token.line, token.column, "Unterminated string");
                return false;
            }

            tokens.push_back(std::move(token));
            i = j + quote_len;
            continue;
        }

        if (c == '/') {
            result.set_error(ParseErrorKind::Tokenization, line, i - line_start + 1, "Unexpected character '/'");
            return false;
        }

        auto token = make_token(0, i);
        std::size_t j = i;
        while (j < n && !is_delimiter(text[j]) && !(text[j] == '/' && j + 1 < n && text[j + 1] == '/')) {
            j++;
        }
        token.text = text.substr(i, j - i);
        classify_word(token);
        tokens.push_back(std::move(token));
        i = j;
    }

    Token terminator;
    terminator.id = TokenId_Terminator;
    terminator.line = line;
    terminator.column = n - line_start + 1;
    tokens.push_back(terminator);

    result.kind = ParseErrorKind::None;
    return true;
}

std::string
conf_tokenizer::repr(TokenId id) {
    // clang-format off
    static const std::vector<std::tuple<TokenId, std::string>> kNames = {
        { TokenId_OpenBracket,  "OpenBracket" },
        { TokenId_CloseBracket, "CloseBracket" },
        { TokenId_Assign,       "Assign" },
        { TokenId_OpenCurly,    "OpenCurly" },
        { TokenId_CloseCurly,   "CloseCurly" },
        { TokenId_Comma,        "Comma" },
        { TokenId_Boolean,      "Boolean" },
        { TokenId_Integer,      "Integer" },
        { TokenId_Float,        "Float" },
        { TokenId_String,       "String" },
        { TokenId_Identifier,   "Identifier" },
        { TokenId_Comment,      "Comment" },
        { TokenId_Terminator,   "Terminator" },
        { TokenId_FirstOnLine,  "FirstOnLine" },
    };
    // clang-format on

    std::vector<std::string> names;
    for (const auto& [bit, name] : kNames) {
        if (id & bit) {
            names.push_back(name);
        }
    }
    return names.empty() ? "None" : join(names, "|");
}
