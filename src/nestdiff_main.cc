#include "config/config.hpp"
#include "matching/document_matcher.hpp"
#include "output/json_patch.hpp"
#include "output/unified.hpp"
#include "parser/decode.hpp"
#include "util/log.hpp"
#include "util/tty.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <gsl/span>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#ifndef NESTDIFF_VERSION
#define NESTDIFF_VERSION "unknown"
#endif

namespace fs = std::filesystem;

namespace {

// clang-format off
const int kExitNoDifferences = 0;
const int kExitDifferences   = 1;
const int kExitError         = 2;
// clang-format on

enum class FileStatus {
    kOk,
    kStdin,
    kFileDoesNotExist,
    kFileNotReadable,
    kNoPermission,
};

FileStatus
check_file_status(const std::string& path) {
    if (path == "-") {
        return FileStatus::kStdin;
    }

    std::error_code ec;
    fs::path file_path(path);

    if (!fs::exists(file_path, ec)) {
        return FileStatus::kFileDoesNotExist;
    }

    if (!(fs::is_regular_file(file_path, ec) || fs::is_fifo(file_path, ec) || fs::is_character_file(file_path, ec))) {
        return FileStatus::kFileNotReadable;
    }

    auto perms = fs::status(file_path, ec).permissions();
    if (((perms & fs::perms::owner_read) == fs::perms::none) &&
        ((perms & fs::perms::group_read) == fs::perms::none) &&
        ((perms & fs::perms::others_read) == fs::perms::none)) {
        return FileStatus::kNoPermission;
    }

    return FileStatus::kOk;
}

std::string
to_string(const FileStatus status) {
    switch (status) {
        case FileStatus::kOk:
            return "Success";
        case FileStatus::kStdin:
            return "Standard input";
        case FileStatus::kFileDoesNotExist:
            return "File does not exist";
        case FileStatus::kFileNotReadable:
            return "File is not readable";
        case FileStatus::kNoPermission:
            return "Permission denied";
    }
    return "Unknown";
}

std::optional<int64_t>
parse_integer(const char* text) {
    if (text == nullptr || *text == '\0') {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

// Decode one input. `format_name` overrides detection by file name.
bool
load_documents(const std::string& path,
               const std::string& format_name,
               std::vector<nestdiff::ValuePtr>& docs,
               nestdiff::ParseResult& result) {
    std::string text;
    if (!nestdiff::read_input(path, text, result)) {
        return false;
    }

    const auto format = format_name.empty() ? nestdiff::detect_format_from_filename(path)
                                            : nestdiff::input_format_from_string(format_name);
    if (format == nestdiff::InputFormat::kInvalid) {
        result.set_error(nestdiff::ParseErrorKind::Format, fmt::format("unsupported format: {}", format_name));
        return false;
    }

    NESTDIFF_DEBUG("{}: decoding as {}\n", path, nestdiff::repr(format));
    if (!nestdiff::decode_documents(text, format, docs, result)) {
        return false;
    }
    NESTDIFF_DEBUG("{}: {} document(s)\n", path, docs.size());
    return true;
}

}  // namespace

int
main(int argc, char* argv[]) {
    nestdiff::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] file1 file2

Compare two structured documents (JSON, YAML, conf) by structure.
Use '-' to read one of the inputs from stdin.

Options:
    -a, --show-all               show unchanged values as well
    -C [context_lines]           unchanged siblings around each change (default 3, <0: none)
    -s, --array-strategy [name]  how to pair array elements
                                     value (v)  best content match
                                     index (i)  by position
    -f, --format [name]          output format: unified (u), json-patch (j)

    -z, --ignore-zero-values     treat null, false, 0, "", [] and {{}} as absent
    -e, --ignore-empty           ignore fields missing on one side
    -k, --ignore-key-case        compare object keys case-insensitively
    -i, --ignore-value-case      compare strings case-insensitively

        --format1 [name]         input format of file1: json, yaml, conf
        --format2 [name]         input format of file2: json, yaml, conf

        --color, --no-color      force colors on or off
    -v, --verbose                print diagnostics to stderr
    -h, --help                   show this help
        --version                show program version and exit

Exit status is 0 when the inputs are equal, 1 when they differ and 2 on error.
)",
                                       argv[0]);

        help += "\nConfig directory:\n    " + nestdiff::config_get_directory() + "\n";

        if (!optional_error_message.empty()) {
            fmt::print(stderr, "{}\nerror: {}\n", help, optional_error_message);
        } else {
            fmt::print("{}", help);
        }
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) {
        // clang-format off
        static struct option long_options[] = {
            { "help",               no_argument,       0, 'h' },
            { "verbose",            no_argument,       0, 'v' },
            { "version",            no_argument,       0, 'V' },
            { "show-all",           no_argument,       0, 'a' },
            { "array-strategy",     required_argument, 0, 's' },
            { "format",             required_argument, 0, 'f' },
            { "format1",            required_argument, 0, '1' },
            { "format2",            required_argument, 0, '2' },
            { "ignore-zero-values", no_argument,       0, 'z' },
            { "ignore-empty",       no_argument,       0, 'e' },
            { "ignore-key-case",    no_argument,       0, 'k' },
            { "ignore-value-case",  no_argument,       0, 'i' },
            { "color",              no_argument,       0, 'c' },
            { "no-color",           no_argument,       0, 'n' },
            { 0, 0, 0, 0 }
        };
        // clang-format on

        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvaC:s:f:zeki", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'V':
                    fmt::print("version: {}\n", NESTDIFF_VERSION);
                    exit(kExitNoDifferences);
                case 'h':
                    opts.help = true;
                    return true;
                case 'v':
                    opts.verbose = true;
                    break;
                case 'a':
                    opts.show_all = true;
                    break;
                case 'C': {
                    auto value = parse_integer(optarg);
                    if (!value) {
                        show_help(fmt::format("invalid value for -C ({})", optarg));
                        return false;
                    }
                    opts.context_lines = *value;
                    opts.context_lines_given = true;
                } break;
                case 's': {
                    auto strategy = nestdiff::array_strategy_from_string(optarg);
                    if (strategy == nestdiff::ArrayStrategy::kInvalid) {
                        show_help(fmt::format("invalid array strategy: {}", optarg));
                        return false;
                    }
                    opts.diff.array_strategy = strategy;
                } break;
                case 'f': {
                    auto format = nestdiff::output_format_from_string(optarg);
                    if (format == nestdiff::OutputFormat::kInvalid) {
                        show_help(fmt::format("invalid output format: {}", optarg));
                        return false;
                    }
                    opts.output = format;
                } break;
                case '1':
                    opts.left_format = optarg;
                    break;
                case '2':
                    opts.right_format = optarg;
                    break;
                case 'z':
                    opts.diff.ignore_zero_values = true;
                    break;
                case 'e':
                    opts.diff.ignore_empty_fields = true;
                    break;
                case 'k':
                    opts.diff.ignore_key_case = true;
                    break;
                case 'i':
                    opts.diff.ignore_value_case = true;
                    break;
                case 'c':
                    opts.color = nestdiff::ColorMode::kAlways;
                    break;
                case 'n':
                    opts.color = nestdiff::ColorMode::kNever;
                    break;
                case '?':
                    show_help("invalid option");
                    return false;
                default:
                    show_help(fmt::format("invalid option: -{}", static_cast<char>(c)));
                    return false;
            }
        }

        if (opts.show_all && opts.context_lines_given) {
            show_help("--show-all and -C are incompatible");
            return false;
        }

        const int positional_count = in_argc - optind;
        if (positional_count != 2) {
            show_help("expected exactly two files");
            return false;
        }

        opts.left_file = in_argv[optind];
        opts.right_file = in_argv[optind + 1];

        if (opts.left_file == "-" && opts.right_file == "-") {
            show_help("stdin can only be used for one of the inputs");
            return false;
        }

        auto a_status = check_file_status(opts.left_file);
        auto b_status = check_file_status(opts.right_file);
        auto a_valid = a_status == FileStatus::kOk || a_status == FileStatus::kStdin;
        auto b_valid = b_status == FileStatus::kOk || b_status == FileStatus::kStdin;
        if (!a_valid || !b_valid) {
            if (!a_valid)
                fmt::print(stderr, "error: '{}': {}\n", opts.left_file, to_string(a_status));
            if (!b_valid)
                fmt::print(stderr, "error: '{}': {}\n", opts.right_file, to_string(b_status));
            return false;
        }

        return true;
    };

    // Load the global defaults before we override them with command line args
    nestdiff::config_apply_options(opts);

    if (!parse_args(argc, argv)) {
        return kExitError;
    }

    if (opts.help) {
        show_help("");
        return kExitNoDifferences;
    }

    nestdiff::log_set_verbose(opts.verbose);

    std::vector<nestdiff::ValuePtr> docs_a;
    std::vector<nestdiff::ValuePtr> docs_b;

    nestdiff::ParseResult result;
    if (!load_documents(opts.left_file, opts.left_format, docs_a, result)) {
        fmt::print(stderr, "error: {}: {}\n", opts.left_file, result.error);
        return kExitError;
    }
    if (!load_documents(opts.right_file, opts.right_format, docs_b, result)) {
        fmt::print(stderr, "error: {}: {}\n", opts.right_file, result.error);
        return kExitError;
    }

    NESTDIFF_DEBUG("array strategy: {}\n", nestdiff::repr(opts.diff.array_strategy));

    const auto results = nestdiff::match_documents(docs_a, docs_b, opts.diff);

    std::vector<std::string> lines;
    switch (opts.output) {
        case nestdiff::OutputFormat::kJsonPatch: {
            lines = nestdiff::json_patch_render(results);
        } break;
        case nestdiff::OutputFormat::kUnified:
        case nestdiff::OutputFormat::kInvalid: {
            nestdiff::UnifiedOptions unified_options;
            unified_options.show_all = opts.show_all;
            unified_options.context_lines = opts.context_lines;
            unified_options.color = opts.color == nestdiff::ColorMode::kAlways ||
                                    (opts.color == nestdiff::ColorMode::kAuto && nestdiff::tty_stdout_supports_color());
            unified_options.colors = opts.colors;
            lines = nestdiff::unified_diff_render(results, unified_options);
        } break;
    }

    for (const auto& line : lines) {
        fmt::print("{}\n", line);
    }

    return nestdiff::has_differences(results) ? kExitDifferences : kExitNoDifferences;
}
