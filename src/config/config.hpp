#pragma once

#include "compare/options.hpp"
#include "parser/parse_result.hpp"
#include "util/color.hpp"

#include <cstdint>
#include <string>

namespace nestdiff {

enum class OutputFormat { kInvalid, kUnified, kJsonPatch };

OutputFormat
output_format_from_string(const std::string& s);

std::string
repr(OutputFormat format);

enum class ColorMode { kInvalid, kAuto, kAlways, kNever };

ColorMode
color_mode_from_string(const std::string& s);

struct ProgramOptions {
    bool help = false;
    bool verbose = false;

    bool show_all = false;
    int64_t context_lines = 3;
    bool context_lines_given = false;  // -C on the command line

    DiffOptions diff;

    OutputFormat output = OutputFormat::kUnified;
    ColorMode color = ColorMode::kAuto;
    ColorScheme colors;

    // Empty: detect from the file name.
    std::string left_format;
    std::string right_format;

    std::string left_file;
    std::string right_file;
};

std::string
config_get_directory();

// Apply the settings of `<config dir>/nestdiff.conf`. A missing file is
// fine; an invalid one is reported on stderr and leaves the defaults.
void
config_apply_options(ProgramOptions& program_options);

// Apply settings from conf text. Unknown keys are ignored, values of the
// wrong type or with an unknown name are skipped with a warning.
bool
config_apply_text(const std::string& config_text, ProgramOptions& program_options, ParseResult& result);

}  // namespace nestdiff
