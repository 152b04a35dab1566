#include "parser/conf_parser.hpp"

#include "parser/conf_tokenizer.hpp"

#include <fmt/format.h>

#include <stack>
#include <tuple>

#define TRACE_ENABLE 0
#define TRACE(...)                       \
    if (TRACE_ENABLE) {                  \
        fmt::print(stderr, __VA_ARGS__); \
    }

using namespace nestdiff;
using namespace nestdiff::conf_tokenizer;

namespace {

// Parser states. A table document starts at `ParseSection` or `ParseKey`,
// a single value document at `ParseObject`. `ParseSeparator` decides what
// may follow a complete value in the current scope.
enum class State {
    ParseSection,
    ParseKey,
    ParseObject,
    ParseValue,
    ParseTableStart,
    ParseArrayStart,
    ParseSeparator,
    PopScope,
    Finish,
};

enum class Scope {
    Root,
    Section,
    Table,
    Array,
};

std::string
repr(State s) {
    // clang-format off
    static const std::vector<std::tuple<State, std::string>> lut = {
        { State::ParseSection,    "ParseSection" },
        { State::ParseKey,        "ParseKey" },
        { State::ParseObject,     "ParseObject" },
        { State::ParseValue,      "ParseValue" },
        { State::ParseTableStart, "ParseTableStart" },
        { State::ParseArrayStart, "ParseArrayStart" },
        { State::ParseSeparator,  "ParseSeparator" },
        { State::PopScope,        "PopScope" },
        { State::Finish,          "Finish" },
    };
    // clang-format on

    for (const auto& [state, name] : lut) {
        if (state == s) {
            return name;
        }
    }
    return "?";
}

std::string
describe(const Token& token) {
    if (token.id & TokenId_Terminator) {
        return "end of input";
    }
    return fmt::format("'{}'", token.text);
}

}  // namespace

bool
nestdiff::conf_parse(const std::string& input_data,
                     ParseResult& result,
                     const std::function<void(TbInstruction)>& emit_cb) {
    std::vector<Token> tokens;
    if (!conf_tokenizer::tokenize(input_data, tokens, result)) {
        return false;
    }

    //
    // Internal state:
    //       tokens | all tokens, terminated by TokenId_Terminator
    //       cursor | current index into `tokens`
    //        state | current parsing state
    //  scope_stack | open tables, sections and arrays
    //
    std::size_t cursor = 0;
    std::stack<Scope> scope_stack;
    State state = State::ParseObject;

    auto token = [&]() -> const Token& { return tokens[cursor]; };

    auto advance = [&]() {
        if (!(token().id & TokenId_Terminator)) {
            cursor++;
        }
    };

    auto emit_ins = [&](TbInstruction ins, const Token& at) {
        ins.line = at.line;
        ins.column = at.column;
        TRACE("* Emit {} '{}'\n", repr(ins.op), ins.oparg_string);
        emit_cb(std::move(ins));
    };

    auto eat_comments = [&]() {
        while (token().id & TokenId_Comment) {
            emit_ins(TbInstruction::Comment(token().text), token());
            cursor++;
        }
    };

    auto give_up = [&](const std::string& expected) {
        result.set_error(ParseErrorKind::Parsing, token().line, token().column,
                         fmt::format("Expected {}, found {}", expected, describe(token())));
        return false;
    };

    //
    // Look at the first few tokens to pick the entry state.
    //
    {
        std::vector<const Token*> lookahead;
        for (const auto& t : tokens) {
            if (!(t.id & TokenId_Comment)) {
                lookahead.push_back(&t);
            }
            if (lookahead.size() >= 3) {
                break;
            }
        }

        const bool is_section = lookahead.size() >= 3 && (lookahead[0]->id & TokenId_OpenBracket) &&
                                (lookahead[1]->id & TokenId_MetaKey) && (lookahead[2]->id & TokenId_CloseBracket);
        const bool is_pair =
            lookahead.size() >= 2 && (lookahead[0]->id & TokenId_MetaKey) && (lookahead[1]->id & TokenId_Assign);
        const bool is_empty = lookahead[0]->id & TokenId_Terminator;

        if (is_section || is_pair || is_empty) {
            emit_ins(TbInstruction::TableStart(), *lookahead[0]);
            scope_stack.push(Scope::Root);
            state = is_section ? State::ParseSection : (is_pair ? State::ParseKey : State::Finish);
        }
    }

    while (true) {
        eat_comments();

        TRACE("({}:[#{}]) Token {} '{}'\n", repr(state), scope_stack.size(), conf_tokenizer::repr(token().id),
              token().text);

        switch (state) {
            case State::ParseSection: {
                if (!(token().id & TokenId_OpenBracket)) {
                    return give_up("'['");
                }
                advance();

                if (!(token().id & TokenId_MetaKey)) {
                    return give_up("a section name");
                }
                const Token& name = token();
                emit_ins(TbInstruction::Key(name.text), name);
                emit_ins(TbInstruction::TableStart(), name);
                scope_stack.push(Scope::Section);
                advance();

                if (!(token().id & TokenId_CloseBracket)) {
                    return give_up("']'");
                }
                advance();

                state = State::ParseSeparator;
            } break;

            case State::ParseKey: {
                // Consume ´key´ in ´key = ...´
                if (!(token().id & TokenId_MetaKey)) {
                    return give_up("a key");
                }
                emit_ins(TbInstruction::Key(token().text), token());
                advance();

                eat_comments();

                if (!(token().id & TokenId_Assign)) {
                    return give_up("'='");
                }
                advance();

                state = State::ParseObject;
            } break;

            case State::ParseObject: {
                if (token().id & TokenId_OpenBracket) {
                    state = State::ParseArrayStart;
                } else if (token().id & TokenId_OpenCurly) {
                    state = State::ParseTableStart;
                } else if (token().id & TokenId_MetaValue) {
                    state = State::ParseValue;
                } else {
                    return give_up("a value");
                }
            } break;

            case State::ParseValue: {
                const Token& t = token();
                if (t.id & TokenId_Boolean) {
                    emit_ins(TbInstruction::Value(t.token_boolean_arg), t);
                } else if (t.id & TokenId_Integer) {
                    emit_ins(TbInstruction::Value(t.token_int_arg), t);
                } else if (t.id & TokenId_Float) {
                    emit_ins(TbInstruction::Value(t.token_float_arg), t);
                } else {
                    // Quoted strings and bare words
                    emit_ins(TbInstruction::Value(t.text), t);
                }
                advance();
                state = State::ParseSeparator;
            } break;

            case State::ParseTableStart: {
                emit_ins(TbInstruction::TableStart(), token());
                scope_stack.push(Scope::Table);
                advance();

                eat_comments();
                state = (token().id & TokenId_CloseCurly) ? State::PopScope : State::ParseKey;
            } break;

            case State::ParseArrayStart: {
                emit_ins(TbInstruction::ArrayStart(), token());
                scope_stack.push(Scope::Array);
                advance();

                eat_comments();
                state = (token().id & TokenId_CloseBracket) ? State::PopScope : State::ParseObject;
            } break;

            case State::ParseSeparator: {
                if (scope_stack.empty()) {
                    if (!(token().id & TokenId_Terminator)) {
                        return give_up("end of input");
                    }
                    state = State::Finish;
                    break;
                }

                switch (scope_stack.top()) {
                    case Scope::Root:
                    case Scope::Section: {
                        if (token().id & TokenId_MetaKey) {
                            state = State::ParseKey;
                        } else if (token().id & TokenId_OpenBracket) {
                            if (scope_stack.top() == Scope::Section) {
                                emit_ins(TbInstruction::TableEnd(), token());
                                scope_stack.pop();
                            }
                            state = State::ParseSection;
                        } else if (token().id & TokenId_Terminator) {
                            state = State::Finish;
                        } else {
                            return give_up("a key or a section");
                        }
                    } break;
                    case Scope::Table: {
                        if (token().id & TokenId_Comma) {
                            advance();
                            eat_comments();
                            state = (token().id & TokenId_CloseCurly) ? State::PopScope : State::ParseKey;
                        } else if (token().id & TokenId_CloseCurly) {
                            state = State::PopScope;
                        } else {
                            return give_up("',' or '}'");
                        }
                    } break;
                    case Scope::Array: {
                        if (token().id & TokenId_Comma) {
                            advance();
                            eat_comments();
                            state = (token().id & TokenId_CloseBracket) ? State::PopScope : State::ParseObject;
                        } else if (token().id & TokenId_CloseBracket) {
                            state = State::PopScope;
                        } else {
                            return give_up("',' or ']'");
                        }
                    } break;
                }
            } break;

            case State::PopScope: {
                const Scope child_scope = scope_stack.top();
                TRACE("* Popping scope\n");
                scope_stack.pop();

                emit_ins(child_scope == Scope::Array ? TbInstruction::ArrayEnd() : TbInstruction::TableEnd(), token());
                advance();

                state = State::ParseSeparator;
            } break;

            case State::Finish: {
                while (!scope_stack.empty()) {
                    // Only sections and the root table can still be open here.
                    emit_ins(TbInstruction::TableEnd(), token());
                    scope_stack.pop();
                }
                result.kind = ParseErrorKind::None;
                return true;
            }
        }
    }
}

bool
nestdiff::conf_parse_collect(const std::string& input_data,
                             ParseResult& result,
                             std::vector<TbInstruction>& instructions) {
    return conf_parse(input_data, result, [&](TbInstruction ins) { instructions.push_back(std::move(ins)); });
}

bool
nestdiff::conf_parse_value_tree(const std::string& input_data, ParseResult& result, ValuePtr& root) {
    struct Frame {
        bool is_array = false;
        std::string key;
        Metadata meta;
        Value::Array elements;
        Value::Object fields;
    };

    std::stack<Frame> frames;
    std::string last_key;
    ValuePtr tree;
    bool structure_ok = true;

    auto meta_at = [](const TbInstruction& ins) {
        Metadata meta;
        meta.format = "conf";
        meta.location = Location{static_cast<int>(ins.line), static_cast<int>(ins.column)};
        return meta;
    };

    auto attach = [&](ValuePtr value, const std::string& key) {
        if (frames.empty()) {
            tree = std::move(value);
        } else if (frames.top().is_array) {
            frames.top().elements.push_back(std::move(value));
        } else {
            frames.top().fields.insert(key, std::move(value));
        }
    };

    auto update_tree = [&](TbInstruction ins) {
        switch (ins.op) {
            case TbOperator::Comment:
                break;
            case TbOperator::Key:
                last_key = ins.oparg_string;
                break;
            case TbOperator::TableStart:
            case TbOperator::ArrayStart: {
                Frame frame;
                frame.is_array = ins.op == TbOperator::ArrayStart;
                frame.key = last_key;
                frame.meta = meta_at(ins);
                frames.push(std::move(frame));
            } break;
            case TbOperator::TableEnd:
            case TbOperator::ArrayEnd: {
                if (frames.empty()) {
                    structure_ok = false;
                    break;
                }
                Frame frame = std::move(frames.top());
                frames.pop();
                auto value = frame.is_array ? make_array(std::move(frame.elements), frame.meta)
                                            : make_object(std::move(frame.fields), frame.meta);
                attach(std::move(value), frame.key);
            } break;
            case TbOperator::Value: {
                auto meta = meta_at(ins);
                switch (ins.oparg_type) {
                    case TbValueType::Int:
                        attach(make_int(ins.oparg_int, meta), last_key);
                        break;
                    case TbValueType::Bool:
                        attach(make_bool(ins.oparg_bool, meta), last_key);
                        break;
                    case TbValueType::Float:
                        attach(make_float(ins.oparg_float, meta), last_key);
                        break;
                    case TbValueType::String:
                    case TbValueType::None:
                        attach(make_string(ins.oparg_string, meta), last_key);
                        break;
                }
            } break;
        }
    };

    if (!conf_parse(input_data, result, update_tree)) {
        return false;
    }

    if (!structure_ok || !frames.empty() || !tree) {
        result.set_error(ParseErrorKind::Other, "Unbalanced document structure");
        return false;
    }

    root = std::move(tree);
    return true;
}

std::string
nestdiff::repr(TbOperator op) {
    switch (op) {
        case TbOperator::Key:
            return "Key";
        case TbOperator::Value:
            return "Value";
        case TbOperator::ArrayStart:
            return "ArrayStart";
        case TbOperator::ArrayEnd:
            return "ArrayEnd";
        case TbOperator::TableStart:
            return "TableStart";
        case TbOperator::TableEnd:
            return "TableEnd";
        case TbOperator::Comment:
            return "Comment";
    }
    return "?";
}

std::string
nestdiff::repr(TbValueType vt) {
    switch (vt) {
        case TbValueType::None:
            return "None";
        case TbValueType::Int:
            return "Int";
        case TbValueType::Bool:
            return "Bool";
        case TbValueType::String:
            return "String";
        case TbValueType::Float:
            return "Float";
    }
    return "?";
}
