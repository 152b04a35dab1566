#include "util/strings.hpp"

#include <fmt/format.h>

using namespace nestdiff;

namespace {

char
fold_ascii(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

}  // namespace

std::string
nestdiff::to_lower_ascii(std::string_view s) {
    std::string folded;
    folded.reserve(s.size());
    for (auto c : s) {
        folded.push_back(fold_ascii(c));
    }
    return folded;
}

bool
nestdiff::iequals_ascii(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); i++) {
        if (fold_ascii(a[i]) != fold_ascii(b[i])) {
            return false;
        }
    }
    return true;
}

std::vector<std::string>
nestdiff::split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string
nestdiff::join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

std::string
nestdiff::json_quote(std::string_view s) {
    std::string quoted = "\"";
    for (auto c : s) {
        switch (c) {
            case '"':
                quoted += "\\\"";
                break;
            case '\\':
                quoted += "\\\\";
                break;
            case '\b':
                quoted += "\\b";
                break;
            case '\f':
                quoted += "\\f";
                break;
            case '\n':
                quoted += "\\n";
                break;
            case '\r':
                quoted += "\\r";
                break;
            case '\t':
                quoted += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    quoted += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    quoted += c;
                }
        }
    }
    quoted += "\"";
    return quoted;
}

bool
nestdiff::is_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v";
    for (const auto whitespace : whitespaces) {
        if (whitespace != '\0' && whitespace == c) {
            return true;
        }
    }
    return false;
}

std::string
nestdiff::trim(std::string_view s) {
    std::size_t start = 0;
    std::size_t end = s.size();
    while (start < end && is_whitespace(s[start])) {
        start++;
    }
    while (end > start && is_whitespace(s[end - 1])) {
        end--;
    }
    return std::string{s.substr(start, end - start)};
}
