#pragma once

/*
    Turn input text into document trees.

    json: a single value, or JSON Lines when the text is not one value.
    yaml: a `---` separated stream; empty documents are skipped.
    conf: one document in the conf language (see conf_parser.hpp).
*/

#include "model/value.hpp"
#include "parser/parse_result.hpp"

#include <string>
#include <vector>

namespace nestdiff {

enum class InputFormat { kInvalid, kJson, kYaml, kConf };

// "json", "yaml"/"yml", "conf"/"toml"/"ini"
InputFormat
input_format_from_string(const std::string& name);

std::string
repr(InputFormat format);

// By extension; anything unknown, and stdin ("-"), is yaml.
InputFormat
detect_format_from_filename(const std::string& path);

bool
decode_documents(const std::string& text, InputFormat format, std::vector<ValuePtr>& docs, ParseResult& result);

// Same, with the format given by name. Unknown names fail with
// ParseErrorKind::Format.
bool
decode_documents(const std::string& text,
                 const std::string& format_name,
                 std::vector<ValuePtr>& docs,
                 ParseResult& result);

bool
decode_json(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result);

bool
decode_yaml(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result);

bool
decode_conf(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result);

// Whole file, or all of stdin for "-".
bool
read_input(const std::string& path, std::string& contents, ParseResult& result);

}  // namespace nestdiff
