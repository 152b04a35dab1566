#include "util/color.hpp"

#include <fmt/format.h>

#include <unordered_map>
#include <vector>

using namespace nestdiff;

// clang-format off
const TermColor TermColor::kNone    = TermColor { TermColor::Kind::Ignore,        0 };
const TermColor TermColor::kDefault = TermColor { TermColor::Kind::DefaultColor, 39 };

const TermColor TermColor::kRed        = TermColor { TermColor::Kind::Color4bit, 31 };
const TermColor TermColor::kGreen      = TermColor { TermColor::Kind::Color4bit, 32 };
const TermColor TermColor::kYellow     = TermColor { TermColor::Kind::Color4bit, 33 };
const TermColor TermColor::kBlue       = TermColor { TermColor::Kind::Color4bit, 34 };
const TermColor TermColor::kMagenta    = TermColor { TermColor::Kind::Color4bit, 35 };
const TermColor TermColor::kCyan       = TermColor { TermColor::Kind::Color4bit, 36 };
const TermColor TermColor::kDarkGray   = TermColor { TermColor::Kind::Color4bit, 90 };
const TermColor TermColor::kLightRed   = TermColor { TermColor::Kind::Color4bit, 91 };
const TermColor TermColor::kLightGreen = TermColor { TermColor::Kind::Color4bit, 92 };
const TermColor TermColor::kWhite      = TermColor { TermColor::Kind::Color4bit, 97 };
// clang-format on

std::optional<TermColor>
TermColor::from_string(const std::string& name) {
    // clang-format off
    static const std::unordered_map<std::string, TermColor> kPalette = {
        { "none",        TermColor::kNone },
        { "default",     TermColor::kDefault },
        { "red",         TermColor::kRed },
        { "green",       TermColor::kGreen },
        { "yellow",      TermColor::kYellow },
        { "blue",        TermColor::kBlue },
        { "magenta",     TermColor::kMagenta },
        { "cyan",        TermColor::kCyan },
        { "dark_gray",   TermColor::kDarkGray },
        { "light_red",   TermColor::kLightRed },
        { "light_green", TermColor::kLightGreen },
        { "white",       TermColor::kWhite },
    };
    // clang-format on

    auto it = kPalette.find(name);
    if (it == kPalette.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string
TermStyle::to_ansi() const {
    std::vector<std::string> codes;

    const auto attr_bits = static_cast<uint16_t>(attr);
    if (attr_bits & static_cast<uint16_t>(Attribute::Bold))
        codes.push_back("1");
    if (attr_bits & static_cast<uint16_t>(Attribute::Dim))
        codes.push_back("2");
    if (attr_bits & static_cast<uint16_t>(Attribute::Underline))
        codes.push_back("4");

    if (fg.kind != TermColor::Kind::Ignore) {
        codes.push_back(fmt::format("{}", fg.fg_code));
    }

    if (codes.empty()) {
        return "";
    }

    std::string sequence = "\033[";
    for (std::size_t i = 0; i < codes.size(); i++) {
        sequence += (i == 0 ? "" : ";") + codes[i];
    }
    return sequence + "m";
}

std::string
TermStyle::apply(const std::string& text) const {
    auto start = to_ansi();
    if (start.empty()) {
        return text;
    }
    return start + text + "\033[0m";
}

std::string
nestdiff::repr(const TermColor& color) {
    std::string ks[] = {"4", "D", "I"};
    return fmt::format("{}:({})", ks[static_cast<int>(color.kind)], color.fg_code);
}
