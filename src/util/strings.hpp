#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace nestdiff {

// ASCII-only case folding. Non-ASCII bytes are left untouched.
std::string
to_lower_ascii(std::string_view s);

bool
iequals_ascii(std::string_view a, std::string_view b);

// Split on '\n'. A trailing newline yields a trailing empty line, and an
// empty input yields a single empty line.
std::vector<std::string>
split_lines(std::string_view text);

std::string
join(const std::vector<std::string>& parts, std::string_view separator);

// Quote and escape a string as a JSON string literal.
std::string
json_quote(std::string_view s);

std::string
trim(std::string_view s);

bool
is_whitespace(char c);

}  // namespace nestdiff
