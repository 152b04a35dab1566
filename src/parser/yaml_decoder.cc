#include "parser/decode.hpp"

#include "util/strings.hpp"

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

using namespace nestdiff;

namespace {

bool
is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool
all_chars(std::string_view s, bool (*pred)(char)) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!pred(c)) {
            return false;
        }
    }
    return true;
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool
is_core_float(std::string_view s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        i++;
    }

    std::size_t int_digits = 0;
    while (i < s.size() && is_digit(s[i])) {
        i++;
        int_digits++;
    }

    std::size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        i++;
        while (i < s.size() && is_digit(s[i])) {
            i++;
            frac_digits++;
        }
    }

    if (int_digits == 0 && frac_digits == 0) {
        return false;
    }

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
            i++;
        }
        std::size_t exp_digits = 0;
        while (i < s.size() && is_digit(s[i])) {
            i++;
            exp_digits++;
        }
        if (exp_digits == 0) {
            return false;
        }
    }

    return i == s.size();
}

// Plain scalar resolution per the YAML 1.2 core schema.
ValuePtr
resolve_plain_scalar(const std::string& text, const Metadata& meta) {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return make_null(meta);
    }

    if (text == "true" || text == "True" || text == "TRUE") {
        return make_bool(true, meta);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return make_bool(false, meta);
    }

    const std::string_view s(text);

    // Decimal integers
    {
        const bool negative = s[0] == '-';
        const std::size_t sign = (s[0] == '-' || s[0] == '+') ? 1 : 0;
        const auto digits = s.substr(sign);
        if (all_chars(digits, is_digit)) {
            uint64_t magnitude = 0;
            auto [end, error] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
            if (error == std::errc{} && end == digits.data() + digits.size()) {
                if (!negative) {
                    if (magnitude <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                        return make_int(static_cast<int64_t>(magnitude), meta);
                    }
                    return make_uint(magnitude, meta);
                }
                const auto limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
                if (magnitude <= limit) {
                    return make_int(magnitude == limit ? std::numeric_limits<int64_t>::min()
                                                       : -static_cast<int64_t>(magnitude),
                                    meta);
                }
            }
            return make_float(std::strtod(text.c_str(), nullptr), meta);
        }
    }

    // 0o17 and 0x1F
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'o' || s[1] == 'x')) {
        const int base = s[1] == 'o' ? 8 : 16;
        uint64_t value = 0;
        auto [end, error] = std::from_chars(s.data() + 2, s.data() + s.size(), value, base);
        if (error == std::errc{} && end == s.data() + s.size()) {
            if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return make_int(static_cast<int64_t>(value), meta);
            }
            return make_uint(value, meta);
        }
    }

    if (is_core_float(s)) {
        return make_float(std::strtod(text.c_str(), nullptr), meta);
    }

    // clang-format off
    if (text == ".inf" || text == ".Inf" || text == ".INF" ||
        text == "+.inf" || text == "+.Inf" || text == "+.INF") {
        return make_float(std::numeric_limits<double>::infinity(), meta);
    }
    if (text == "-.inf" || text == "-.Inf" || text == "-.INF") {
        return make_float(-std::numeric_limits<double>::infinity(), meta);
    }
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return make_float(std::numeric_limits<double>::quiet_NaN(), meta);
    }
    // clang-format on

    Metadata string_meta = meta;
    string_meta.string_style = StringStyle::Plain;
    return make_string(text, string_meta);
}

class YamlConverter {
   public:
    explicit YamlConverter(const std::string& source) : source_(source) {}

    ValuePtr
    convert(const YAML::Node& node) const;

   private:
    Metadata
    meta_for(const YAML::Node& node) const;

    StringStyle
    non_plain_style(const YAML::Node& node) const;

    const std::string& source_;
};

Metadata
YamlConverter::meta_for(const YAML::Node& node) const {
    Metadata meta;
    meta.format = "yaml";
    const auto mark = node.Mark();
    if (mark.line >= 0 && mark.column >= 0) {
        meta.location = Location{mark.line + 1, mark.column + 1};
    }
    return meta;
}

// yaml-cpp tags every non-plain scalar "!"; the indicator in the source
// tells block scalars apart from quoted ones.
StringStyle
YamlConverter::non_plain_style(const YAML::Node& node) const {
    const auto mark = node.Mark();
    if (mark.pos >= 0 && static_cast<std::size_t>(mark.pos) < source_.size()) {
        switch (source_[static_cast<std::size_t>(mark.pos)]) {
            case '|':
                return StringStyle::Literal;
            case '>':
                return StringStyle::Folded;
            default:
                break;
        }
    }
    return StringStyle::Quoted;
}

ValuePtr
YamlConverter::convert(const YAML::Node& node) const {
    auto meta = meta_for(node);

    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return make_null(meta);

        case YAML::NodeType::Scalar: {
            if (node.Tag() == "!") {
                meta.string_style = non_plain_style(node);
                return make_string(node.Scalar(), meta);
            }
            // Explicit tags other than the core ones are ignored.
            if (node.Tag() == "tag:yaml.org,2002:str") {
                meta.string_style = StringStyle::Plain;
                return make_string(node.Scalar(), meta);
            }
            return resolve_plain_scalar(node.Scalar(), meta);
        }

        case YAML::NodeType::Sequence: {
            Value::Array elements;
            elements.reserve(node.size());
            for (const auto& element : node) {
                elements.push_back(convert(element));
            }
            return make_array(std::move(elements), meta);
        }

        case YAML::NodeType::Map: {
            Value::Object fields;
            for (const auto& entry : node) {
                const auto& key = entry.first;
                std::string name = key.IsScalar() ? key.Scalar() : YAML::Dump(key);
                fields.insert(name, convert(entry.second));
            }
            return make_object(std::move(fields), meta);
        }
    }

    return make_null(meta);
}

// yaml-cpp reports an empty document as a null node positioned at whatever
// follows it: the next document marker, `...`, or the end of the stream. An
// explicit `null` or `~` is positioned at its own text.
bool
is_empty_document(const YAML::Node& node, const std::string& source) {
    if (!node.IsNull()) {
        return false;
    }

    const auto pos = node.Mark().pos;
    if (pos < 0) {
        return true;
    }

    std::size_t i = static_cast<std::size_t>(pos);
    while (i < source.size()) {
        if (is_whitespace(source[i])) {
            i++;
        } else if (source[i] == '#') {
            auto end = source.find('\n', i);
            i = end == std::string::npos ? source.size() : end;
        } else {
            break;
        }
    }

    const std::string_view rest = std::string_view(source).substr(std::min(i, source.size()));
    return rest.empty() || rest.substr(0, 3) == "---" || rest.substr(0, 3) == "...";
}

}  // namespace

bool
nestdiff::decode_yaml(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result) {
    std::vector<YAML::Node> nodes;
    try {
        nodes = YAML::LoadAll(text);
    } catch (const YAML::Exception& e) {
        result.set_error(ParseErrorKind::Parsing, static_cast<std::size_t>(e.mark.line + 1),
                         static_cast<std::size_t>(e.mark.column + 1), fmt::format("invalid YAML: {}", e.msg));
        return false;
    }

    YamlConverter converter(text);
    for (const auto& node : nodes) {
        if (is_empty_document(node, text)) {
            continue;
        }
        docs.push_back(converter.convert(node));
    }

    result.kind = ParseErrorKind::None;
    return true;
}
