#include "parser/decode.hpp"

#include "parser/conf_parser.hpp"
#include "util/strings.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

using namespace nestdiff;

std::string
nestdiff::repr(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::None:
            return "None";
        case ParseErrorKind::File:
            return "File";
        case ParseErrorKind::Tokenization:
            return "Tokenization";
        case ParseErrorKind::Parsing:
            return "Parsing";
        case ParseErrorKind::Format:
            return "Format";
        case ParseErrorKind::Other:
            return "Other";
    }
    return "?";
}

InputFormat
nestdiff::input_format_from_string(const std::string& name) {
    const auto s = to_lower_ascii(name);
    if (s == "json" || s == "jsonl" || s == "ndjson")
        return InputFormat::kJson;
    else if (s == "yaml" || s == "yml")
        return InputFormat::kYaml;
    else if (s == "conf" || s == "toml" || s == "ini")
        return InputFormat::kConf;
    return InputFormat::kInvalid;
}

std::string
nestdiff::repr(InputFormat format) {
    switch (format) {
        case InputFormat::kInvalid:
            return "invalid";
        case InputFormat::kJson:
            return "json";
        case InputFormat::kYaml:
            return "yaml";
        case InputFormat::kConf:
            return "conf";
    }
    return "invalid";
}

InputFormat
nestdiff::detect_format_from_filename(const std::string& path) {
    if (path == "-") {
        return InputFormat::kYaml;
    }

    auto extension = std::filesystem::path(path).extension().string();
    if (!extension.empty() && extension[0] == '.') {
        extension.erase(0, 1);
    }

    const auto format = input_format_from_string(extension);
    return format == InputFormat::kInvalid ? InputFormat::kYaml : format;
}

bool
nestdiff::decode_documents(const std::string& text,
                           InputFormat format,
                           std::vector<ValuePtr>& docs,
                           ParseResult& result) {
    docs.clear();
    switch (format) {
        case InputFormat::kJson:
            return decode_json(text, docs, result);
        case InputFormat::kYaml:
            return decode_yaml(text, docs, result);
        case InputFormat::kConf:
            return decode_conf(text, docs, result);
        case InputFormat::kInvalid:
            break;
    }
    result.set_error(ParseErrorKind::Format, "unsupported format");
    return false;
}

bool
nestdiff::decode_documents(const std::string& text,
                           const std::string& format_name,
                           std::vector<ValuePtr>& docs,
                           ParseResult& result) {
    const auto format = input_format_from_string(format_name);
    if (format == InputFormat::kInvalid) {
        result.set_error(ParseErrorKind::Format, fmt::format("unsupported format: {}", format_name));
        return false;
    }
    return decode_documents(text, format, docs, result);
}

bool
nestdiff::decode_conf(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result) {
    ValuePtr root;
    if (!conf_parse_value_tree(text, result, root)) {
        return false;
    }
    docs.push_back(std::move(root));
    return true;
}

bool
nestdiff::read_input(const std::string& path, std::string& contents, ParseResult& result) {
    const bool from_stdin = path == "-";

    FILE* f = from_stdin ? stdin : fopen(path.c_str(), "rb");
    if (!f) {
        result.set_error(ParseErrorKind::File, fmt::format("{}: {}", path, strerror(errno)));
        return false;
    }

    contents.clear();
    char buffer[4096];
    std::size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) {
        contents.append(buffer, n);
    }

    const bool failed = ferror(f) != 0;
    if (!from_stdin) {
        fclose(f);
    }

    if (failed) {
        result.set_error(ParseErrorKind::File, fmt::format("{}: read error", path));
        return false;
    }

    result.kind = ParseErrorKind::None;
    return true;
}
