#include "parser/decode.hpp"

#include "util/strings.hpp"

#include <json/json.h>

#include <fmt/format.h>

#include <memory>

using namespace nestdiff;

namespace {

Metadata
json_meta() {
    Metadata meta;
    meta.format = "json";
    return meta;
}

ValuePtr
convert(const Json::Value& json) {
    switch (json.type()) {
        case Json::nullValue:
            return make_null(json_meta());
        case Json::booleanValue:
            return make_bool(json.asBool(), json_meta());
        case Json::intValue:
            return make_int(json.asInt64(), json_meta());
        case Json::uintValue:
            return make_uint(json.asUInt64(), json_meta());
        case Json::realValue:
            return make_float(json.asDouble(), json_meta());
        case Json::stringValue: {
            Metadata meta = json_meta();
            meta.string_style = StringStyle::Quoted;
            return make_string(json.asString(), meta);
        }
        case Json::arrayValue: {
            Value::Array elements;
            elements.reserve(json.size());
            for (const auto& element : json) {
                elements.push_back(convert(element));
            }
            return make_array(std::move(elements), json_meta());
        }
        case Json::objectValue: {
            // NOTE: jsoncpp hands out members sorted by key, not in source order.
            Value::Object fields;
            for (const auto& name : json.getMemberNames()) {
                fields.insert(name, convert(json[name]));
            }
            return make_object(std::move(fields), json_meta());
        }
    }
    return make_null(json_meta());
}

class JsonReader {
   public:
    JsonReader() {
        Json::CharReaderBuilder builder;
        Json::CharReaderBuilder::strictMode(&builder.settings_);
        builder["strictRoot"] = false;
        builder["failIfExtra"] = false;
        builder["rejectDupKeys"] = false;
        reader_.reset(builder.newCharReader());
    }

    bool
    parse(std::string_view text, Json::Value& root, std::string& errors) const {
        return reader_->parse(text.data(), text.data() + text.size(), &root, &errors);
    }

   private:
    std::unique_ptr<Json::CharReader> reader_;
};

}  // namespace

// A stream of values, parsed one at a time. Values may be separated by any
// whitespace or by nothing.
bool
nestdiff::decode_json(const std::string& text, std::vector<ValuePtr>& docs, ParseResult& result) {
    JsonReader reader;
    const std::string_view view(text);

    std::vector<ValuePtr> values;
    std::size_t offset = 0;
    std::size_t line = 1;
    while (true) {
        while (offset < text.size() && is_whitespace(text[offset])) {
            if (text[offset] == '\n') {
                line++;
            }
            offset++;
        }
        if (offset == text.size()) {
            break;
        }

        Json::Value root;
        std::string errors;
        const auto remaining = view.substr(offset);
        const bool parsed = reader.parse(remaining, root, errors);
        const auto consumed = parsed ? static_cast<std::size_t>(root.getOffsetLimit()) : 0;
        if (!parsed || consumed == 0 || consumed > remaining.size()) {
            if (values.empty()) {
                result.set_error(ParseErrorKind::Parsing, fmt::format("invalid JSON: {}", trim(errors)));
            } else {
                result.set_error(ParseErrorKind::Parsing, fmt::format("invalid JSON on line {}: {}", line, trim(errors)));
            }
            return false;
        }

        values.push_back(convert(root));
        for (std::size_t k = offset; k < offset + consumed; k++) {
            if (text[k] == '\n') {
                line++;
            }
        }
        offset += consumed;
    }

    docs.insert(docs.end(), values.begin(), values.end());
    result.kind = ParseErrorKind::None;
    return true;
}
