#pragma once

#include "model/value.hpp"
#include "parser/parse_result.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace nestdiff {

/**

 conf language parser

 It's basically "INI with arrays, tables, strings, numbers and bools", close
 to a simple subset of TOML.

 The parser works like this:

    Given the input

        [section]
            key = value

    We first tokenize the input text into these tokens:
        [, section, ], key, =, value

    We then parse this stream of tokens and output a linear set of instructions
    that describes the tree:

        TABLE_START
          KEY 'section'
          TABLE_START
            KEY 'key'
            VALUE 'value'
          TABLE_END
        TABLE_END

    The tree builder turns those into a Value.

 A document is either a single value (`"text"`, `[1, 2]`, `{ a = 1 }`) or
 a table: `key = value` pairs followed by any number of sections.
*/

// Tree builder value type
enum class TbValueType {
    None,
    Int,
    Bool,
    String,
    Float,
};

// Tree builder operator
enum class TbOperator {
    Key,
    Value,
    ArrayStart,
    ArrayEnd,
    TableStart,
    TableEnd,
    Comment,
};

// Tree builder instruction
struct TbInstruction {
    static TbInstruction
    Comment(const std::string& comment) {
        TbInstruction ins;
        ins.op = TbOperator::Comment;
        ins.oparg_string = comment;
        return ins;
    }

    static TbInstruction
    ArrayStart() {
        TbInstruction ins;
        ins.op = TbOperator::ArrayStart;
        return ins;
    }

    static TbInstruction
    ArrayEnd() {
        TbInstruction ins;
        ins.op = TbOperator::ArrayEnd;
        return ins;
    }

    static TbInstruction
    TableStart() {
        TbInstruction ins;
        ins.op = TbOperator::TableStart;
        return ins;
    }

    static TbInstruction
    TableEnd() {
        TbInstruction ins;
        ins.op = TbOperator::TableEnd;
        return ins;
    }

    static TbInstruction
    Key(const std::string& key) {
        TbInstruction ins;
        ins.op = TbOperator::Key;
        ins.oparg_string = key;
        return ins;
    }

    static TbInstruction
    Value(const char* value) {
        return Value(std::string(value));
    }

    static TbInstruction
    Value(const std::string& value) {
        TbInstruction ins;
        ins.op = TbOperator::Value;
        ins.oparg_type = TbValueType::String;
        ins.oparg_string = value;
        return ins;
    }

    static TbInstruction
    Value(int64_t value) {
        TbInstruction ins;
        ins.op = TbOperator::Value;
        ins.oparg_type = TbValueType::Int;
        ins.oparg_int = value;
        return ins;
    }

    static TbInstruction
    Value(int value) {
        return Value(static_cast<int64_t>(value));
    }

    static TbInstruction
    Value(bool value) {
        TbInstruction ins;
        ins.op = TbOperator::Value;
        ins.oparg_type = TbValueType::Bool;
        ins.oparg_bool = value;
        return ins;
    }

    static TbInstruction
    Value(double value) {
        TbInstruction ins;
        ins.op = TbOperator::Value;
        ins.oparg_type = TbValueType::Float;
        ins.oparg_float = value;
        return ins;
    }

    TbOperator op = TbOperator::Comment;
    TbValueType oparg_type = TbValueType::None;
    std::string oparg_string;
    int64_t oparg_int = 0;
    bool oparg_bool = false;
    double oparg_float = 0.0;

    // Source position of the token that produced the instruction.
    std::size_t line = 0;
    std::size_t column = 0;

    // Positions are not compared.
    bool
    operator==(const TbInstruction& other) const {
        if (op != other.op || oparg_type != other.oparg_type) {
            return false;
        }
        switch (oparg_type) {
            case TbValueType::None:
                return oparg_string == other.oparg_string;
            case TbValueType::String:
                return oparg_string == other.oparg_string;
            case TbValueType::Int:
                return oparg_int == other.oparg_int;
            case TbValueType::Bool:
                return oparg_bool == other.oparg_bool;
            case TbValueType::Float:
                return std::abs(oparg_float - other.oparg_float) < 0.0000001;
        }
        return false;
    }
};

bool
conf_parse(const std::string& input_data, ParseResult& result, const std::function<void(TbInstruction)>& emit_cb);

bool
conf_parse_collect(const std::string& input_data, ParseResult& result, std::vector<TbInstruction>& instructions);

// Parse into a value tree. Scalars carry "conf" and their line/column in
// their metadata.
bool
conf_parse_value_tree(const std::string& input_data, ParseResult& result, ValuePtr& root);

std::string
repr(TbOperator op);

std::string
repr(TbValueType vt);

}  // namespace nestdiff
