#include "config/config.hpp"

#include "parser/conf_parser.hpp"
#include "parser/decode.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

using namespace nestdiff;

namespace {

enum class ConfigVariableType {
    Bool,
    Int,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

// Find a nested value using e.g. "general.context_lines"
ValuePtr
lookup_value_by_path(const ValuePtr& root, std::string_view dotted_path) {
    ValuePtr value = root;
    while (value && !dotted_path.empty()) {
        const auto pos = dotted_path.find('.');
        const auto head = dotted_path.substr(0, pos);
        value = find_field(value, std::string{head});
        dotted_path = pos == std::string_view::npos ? std::string_view{} : dotted_path.substr(pos + 1);
    }
    return value;
}

ConfigLoadResult
config_load_file(const std::string& config_path, ValuePtr& config_table, ParseResult& load_result) {
    if (!std::filesystem::exists(config_path)) {
        return ConfigLoadResult::DoesNotExist;
    }

    std::string text;
    if (!read_input(config_path, text, load_result)) {
        return ConfigLoadResult::Invalid;
    }

    if (!conf_parse_value_tree(text, load_result, config_table)) {
        return ConfigLoadResult::Invalid;
    }

    if (!config_table->is_object()) {
        load_result.set_error(ParseErrorKind::Parsing, "expected a table of settings");
        return ConfigLoadResult::Invalid;
    }

    return ConfigLoadResult::Ok;
}

void
config_apply_options(const ValuePtr& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        auto stored_value = lookup_value_by_path(config, path);
        if (!stored_value) {
            continue;
        }

        switch (type) {
            case ConfigVariableType::Bool: {
                if (!stored_value->is_bool()) {
                    fmt::print(stderr, "warning: config: '{}' should be a boolean\n", path);
                    break;
                }
                *static_cast<bool*>(ptr) = stored_value->as_bool();
            } break;
            case ConfigVariableType::Int: {
                auto number = stored_value->is_number() ? stored_value->as_number().as_integral() : std::nullopt;
                if (!number) {
                    fmt::print(stderr, "warning: config: '{}' should be an integer\n", path);
                    break;
                }
                *static_cast<int64_t*>(ptr) = *number;
            } break;
            case ConfigVariableType::String: {
                if (!stored_value->is_string()) {
                    fmt::print(stderr, "warning: config: '{}' should be a string\n", path);
                    break;
                }
                *static_cast<std::string*>(ptr) = stored_value->as_string();
            } break;
        }
    }
}

void
apply_config_table(const ValuePtr& config, ProgramOptions& program_options) {
    std::string array_strategy = repr(program_options.diff.array_strategy);
    std::string output_format = repr(program_options.output);
    std::string color = "auto";
    std::string delete_color;
    std::string insert_color;
    std::string marker_color;

    // clang-format off
    const OptionVector options = {
       { "general.context_lines",      ConfigVariableType::Int,    &program_options.context_lines },
       { "general.show_all",           ConfigVariableType::Bool,   &program_options.show_all },
       { "general.array_strategy",     ConfigVariableType::String, &array_strategy },
       { "general.output_format",      ConfigVariableType::String, &output_format },
       { "general.color",              ConfigVariableType::String, &color },
       { "general.ignore_empty",       ConfigVariableType::Bool,   &program_options.diff.ignore_empty_fields },
       { "general.ignore_zero_values", ConfigVariableType::Bool,   &program_options.diff.ignore_zero_values },
       { "general.ignore_key_case",    ConfigVariableType::Bool,   &program_options.diff.ignore_key_case },
       { "general.ignore_value_case",  ConfigVariableType::Bool,   &program_options.diff.ignore_value_case },
       { "colors.delete",              ConfigVariableType::String, &delete_color },
       { "colors.insert",              ConfigVariableType::String, &insert_color },
       { "colors.marker",              ConfigVariableType::String, &marker_color },
    };
    // clang-format on

    config_apply_options(config, options);

    if (auto strategy = array_strategy_from_string(array_strategy); strategy != ArrayStrategy::kInvalid) {
        program_options.diff.array_strategy = strategy;
    } else {
        fmt::print(stderr, "warning: config: unknown array strategy '{}'\n", array_strategy);
    }

    if (auto format = output_format_from_string(output_format); format != OutputFormat::kInvalid) {
        program_options.output = format;
    } else {
        fmt::print(stderr, "warning: config: unknown output format '{}'\n", output_format);
    }

    if (lookup_value_by_path(config, "general.color")) {
        if (auto mode = color_mode_from_string(color); mode != ColorMode::kInvalid) {
            program_options.color = mode;
        } else {
            fmt::print(stderr, "warning: config: unknown color mode '{}'\n", color);
        }
    }

    auto apply_color = [](const std::string& name, TermStyle& style) {
        if (name.empty()) {
            return;
        }
        if (auto term_color = TermColor::from_string(name)) {
            style.fg = *term_color;
        } else {
            fmt::print(stderr, "warning: config: unknown color '{}'\n", name);
        }
    };
    apply_color(delete_color, program_options.colors.deleted);
    apply_color(insert_color, program_options.colors.inserted);
    apply_color(marker_color, program_options.colors.marker);
}

}  // namespace

std::string
nestdiff::config_get_directory() {
    return fmt::format("{}/nestdiff", sago::getConfigHome());
}

bool
nestdiff::config_apply_text(const std::string& config_text, ProgramOptions& program_options, ParseResult& result) {
    ValuePtr config;
    if (!conf_parse_value_tree(config_text, result, config)) {
        return false;
    }

    if (!config->is_object()) {
        result.set_error(ParseErrorKind::Parsing, "expected a table of settings");
        return false;
    }

    apply_config_table(config, program_options);
    return true;
}

void
nestdiff::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "nestdiff.conf";
    const std::string config_root = config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    ParseResult config_parse_result;
    ValuePtr config;
    switch (config_load_file(config_path, config, config_parse_result)) {
        case ConfigLoadResult::Ok: {
            apply_config_table(config, program_options);
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
        } break;
        case ConfigLoadResult::DoesNotExist:
            break;
    }
}

OutputFormat
nestdiff::output_format_from_string(const std::string& s) {
    if (s == "u" || s == "unified" || s == "default")
        return OutputFormat::kUnified;
    else if (s == "j" || s == "json-patch" || s == "jsonpatch" || s == "patch")
        return OutputFormat::kJsonPatch;
    return OutputFormat::kInvalid;
}

std::string
nestdiff::repr(OutputFormat format) {
    switch (format) {
        case OutputFormat::kUnified:
            return "unified";
        case OutputFormat::kJsonPatch:
            return "json-patch";
        case OutputFormat::kInvalid:
            break;
    }
    return "invalid";
}

ColorMode
nestdiff::color_mode_from_string(const std::string& s) {
    if (s == "auto" || s == "default")
        return ColorMode::kAuto;
    else if (s == "always" || s == "on" || s == "yes")
        return ColorMode::kAlways;
    else if (s == "never" || s == "off" || s == "no")
        return ColorMode::kNever;
    return ColorMode::kInvalid;
}
