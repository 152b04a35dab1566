#include "parser/decode.hpp"

#include <doctest.h>

#include <cmath>
#include <cstdlib>
#include <cstdio>
#include <string>
#include <vector>

using namespace nestdiff;

namespace {

std::vector<ValuePtr>
decode_ok(const std::string& text, InputFormat format) {
    std::vector<ValuePtr> docs;
    ParseResult result;
    REQUIRE(decode_documents(text, format, docs, result));
    REQUIRE(result.is_ok());
    return docs;
}

}  // namespace

TEST_CASE("input formats") {
    REQUIRE(input_format_from_string("json") == InputFormat::kJson);
    REQUIRE(input_format_from_string("JSONL") == InputFormat::kJson);
    REQUIRE(input_format_from_string("yml") == InputFormat::kYaml);
    REQUIRE(input_format_from_string("Yaml") == InputFormat::kYaml);
    REQUIRE(input_format_from_string("toml") == InputFormat::kConf);
    REQUIRE(input_format_from_string("xml") == InputFormat::kInvalid);

    REQUIRE(detect_format_from_filename("deploy.json") == InputFormat::kJson);
    REQUIRE(detect_format_from_filename("a/b/values.YML") == InputFormat::kYaml);
    REQUIRE(detect_format_from_filename("settings.conf") == InputFormat::kConf);
    REQUIRE(detect_format_from_filename("README") == InputFormat::kYaml);
    REQUIRE(detect_format_from_filename("-") == InputFormat::kYaml);

    REQUIRE(repr(InputFormat::kJson) == "json");

    std::vector<ValuePtr> docs;
    ParseResult result;
    REQUIRE_FALSE(decode_documents("{}", "xml", docs, result));
    REQUIRE(result.kind == ParseErrorKind::Format);
    REQUIRE(result.error == "unsupported format: xml");
}

TEST_CASE("json decoding") {
    SUBCASE("single value") {
        auto docs = decode_ok(R"({"b": [1, 2.5, "x", null, true], "a": -3})", InputFormat::kJson);
        REQUIRE(docs.size() == 1);
        REQUIRE(docs[0]->is_object());

        auto b = find_field(docs[0], "b");
        REQUIRE(b->as_array().size() == 5);
        REQUIRE(b->as_array()[0]->as_number().kind == Number::Kind::Int);
        REQUIRE(b->as_array()[1]->as_number().kind == Number::Kind::Float);
        REQUIRE(b->as_array()[2]->meta.string_style == StringStyle::Quoted);
        REQUIRE(b->as_array()[3]->is_null());
        REQUIRE(b->as_array()[4]->as_bool());
        REQUIRE(find_field(docs[0], "a")->as_number().as_integral() == -3);
        REQUIRE(docs[0]->meta.format == "json");
    }

    SUBCASE("scalar root") {
        auto docs = decode_ok("42", InputFormat::kJson);
        REQUIRE(docs.size() == 1);
        REQUIRE(docs[0]->is_number());
    }

    SUBCASE("large unsigned") {
        auto docs = decode_ok("18446744073709551615", InputFormat::kJson);
        REQUIRE(docs[0]->as_number().kind == Number::Kind::UInt);
        REQUIRE(docs[0]->as_number().u == 18446744073709551615ull);
    }

    SUBCASE("json lines") {
        auto docs = decode_ok("{\"id\": 1}\n\n{\"id\": 2}\n", InputFormat::kJson);
        REQUIRE(docs.size() == 2);
        REQUIRE(find_field(docs[1], "id")->as_number().as_integral() == 2);
    }

    SUBCASE("pretty printed stream") {
        auto docs = decode_ok("{\n  \"a\": 1\n}\n{\n  \"b\": [\n    2\n  ]\n}\n", InputFormat::kJson);
        REQUIRE(docs.size() == 2);
        REQUIRE(find_field(docs[0], "a")->as_number().as_integral() == 1);
        REQUIRE(find_field(docs[1], "b")->is_array());
    }

    SUBCASE("values without separators") {
        auto docs = decode_ok(R"({"a":1}{"b":2}[3]"x")", InputFormat::kJson);
        REQUIRE(docs.size() == 4);
        REQUIRE(find_field(docs[1], "b")->as_number().as_integral() == 2);
        REQUIRE(docs[2]->is_array());
        REQUIRE(docs[3]->as_string() == "x");
    }

    SUBCASE("blank input has no documents") {
        REQUIRE(decode_ok("  \n", InputFormat::kJson).empty());
    }

    SUBCASE("invalid") {
        std::vector<ValuePtr> docs;
        ParseResult result;
        REQUIRE_FALSE(decode_json("{\"a\": ", docs, result));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.error.find("invalid JSON") == 0);

        REQUIRE_FALSE(decode_json("{\"a\": 1}\n{oops}\n", docs, result));
        REQUIRE(result.error.find("invalid JSON on line 2") == 0);
    }
}

TEST_CASE("yaml decoding") {
    SUBCASE("multiple documents") {
        auto docs = decode_ok("---\nkind: Pod\n---\n---\nkind: Service\n", InputFormat::kYaml);
        REQUIRE(docs.size() == 2);
        REQUIRE(find_field(docs[0], "kind")->as_string() == "Pod");
        REQUIRE(find_field(docs[1], "kind")->as_string() == "Service");
    }

    SUBCASE("explicit null documents are kept") {
        auto docs = decode_ok("a: 1\n---\nnull\n---\n~\n---\n# only a comment\n---\nb: 2\n", InputFormat::kYaml);
        REQUIRE(docs.size() == 4);
        REQUIRE(docs[1]->is_null());
        REQUIRE(docs[2]->is_null());
        REQUIRE(find_field(docs[3], "b")->as_number().as_integral() == 2);

        auto single = decode_ok("null\n", InputFormat::kYaml);
        REQUIRE(single.size() == 1);
        REQUIRE(single[0]->is_null());
    }

    SUBCASE("keys keep source order") {
        auto docs = decode_ok("zeta: 1\nalpha: 2\n", InputFormat::kYaml);
        REQUIRE(to_json(docs[0]) == R"({"zeta": 1, "alpha": 2})");
    }

    SUBCASE("core schema scalars") {
        auto docs = decode_ok(
            "int: 42\n"
            "neg: -7\n"
            "hex: 0x1F\n"
            "octal: 0o17\n"
            "float: 2.5\n"
            "exp: 1e3\n"
            "inf: .inf\n"
            "nan: .nan\n"
            "yes: true\n"
            "no: FALSE\n"
            "nothing: ~\n"
            "empty:\n"
            "quoted: \"42\"\n"
            "word: hello world\n",
            InputFormat::kYaml);
        const auto& doc = docs[0];

        REQUIRE(find_field(doc, "int")->as_number().as_integral() == 42);
        REQUIRE(find_field(doc, "neg")->as_number().as_integral() == -7);
        REQUIRE(find_field(doc, "hex")->as_number().as_integral() == 31);
        REQUIRE(find_field(doc, "octal")->as_number().as_integral() == 15);
        REQUIRE(find_field(doc, "float")->as_number().as_double() == doctest::Approx(2.5));
        REQUIRE(find_field(doc, "exp")->as_number().as_double() == doctest::Approx(1000.0));
        REQUIRE(std::isinf(find_field(doc, "inf")->as_number().as_double()));
        REQUIRE(std::isnan(find_field(doc, "nan")->as_number().as_double()));
        REQUIRE(find_field(doc, "yes")->as_bool());
        REQUIRE_FALSE(find_field(doc, "no")->as_bool());
        REQUIRE(find_field(doc, "nothing")->is_null());
        REQUIRE(find_field(doc, "empty")->is_null());

        auto quoted = find_field(doc, "quoted");
        REQUIRE(quoted->is_string());
        REQUIRE(quoted->as_string() == "42");
        REQUIRE(quoted->meta.string_style != StringStyle::Plain);

        auto word = find_field(doc, "word");
        REQUIRE(word->as_string() == "hello world");
        REQUIRE(word->meta.string_style == StringStyle::Plain);
    }

    SUBCASE("block scalars") {
        auto docs = decode_ok("script: |\n  set -e\n  make\n", InputFormat::kYaml);
        auto script = find_field(docs[0], "script");
        REQUIRE(script->as_string() == "set -e\nmake\n");
        REQUIRE(script->meta.string_style == StringStyle::Literal);
    }

    SUBCASE("locations") {
        auto docs = decode_ok("a:\n  b: 1\n", InputFormat::kYaml);
        auto b = find_field(find_field(docs[0], "a"), "b");
        REQUIRE(b->meta.format == "yaml");
        REQUIRE(b->meta.location);
        REQUIRE(b->meta.location->line == 2);
    }

    SUBCASE("empty stream") {
        REQUIRE(decode_ok("", InputFormat::kYaml).empty());
    }

    SUBCASE("invalid") {
        std::vector<ValuePtr> docs;
        ParseResult result;
        REQUIRE_FALSE(decode_yaml("a: [1, 2\n", docs, result));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.error.find("invalid YAML") == 0);
    }
}

TEST_CASE("conf decoding") {
    auto docs = decode_ok("[general]\ncontext_lines = 5\n", InputFormat::kConf);
    REQUIRE(docs.size() == 1);
    REQUIRE(to_json(docs[0]) == R"({"general": {"context_lines": 5}})");
}

TEST_CASE("read input") {
    std::string contents;
    ParseResult result;

    SUBCASE("missing file") {
        REQUIRE_FALSE(read_input("/nonexistent/nestdiff/input.yaml", contents, result));
        REQUIRE(result.kind == ParseErrorKind::File);
        REQUIRE(result.error.find("/nonexistent/nestdiff/input.yaml: ") == 0);
    }

    SUBCASE("whole file") {
        char path[] = "/tmp/nestdiff_read_input_XXXXXX";
        const int fd = mkstemp(path);
        REQUIRE(fd >= 0);
        FILE* f = fdopen(fd, "wb");
        REQUIRE(f);
        fputs("a: 1\nb: 2\n", f);
        fclose(f);

        REQUIRE(read_input(path, contents, result));
        REQUIRE(contents == "a: 1\nb: 2\n");
        std::remove(path);
    }
}
