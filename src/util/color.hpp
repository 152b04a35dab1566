#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace nestdiff {

// 16 color palette (SGR codes) plus the default/reset specials.
struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        DefaultColor,
        Ignore,
    };

    Kind kind;
    uint8_t fg_code;

    bool operator==(const TermColor& other) const {
        return other.kind == kind && other.fg_code == fg_code;
    }

    // Palette name; i.e "red", "light_green"
    static std::optional<TermColor>
    from_string(const std::string& name);

    static const TermColor kNone;
    static const TermColor kDefault;

    static const TermColor kRed;
    static const TermColor kGreen;
    static const TermColor kYellow;
    static const TermColor kBlue;
    static const TermColor kMagenta;
    static const TermColor kCyan;
    static const TermColor kDarkGray;
    static const TermColor kLightRed;
    static const TermColor kLightGreen;
    static const TermColor kWhite;
};

struct TermStyle {
    enum class Attribute : uint16_t {
        None      = 0,
        Bold      = 1 << 0,
        Dim       = 1 << 1,
        Underline = 1 << 4,
    };

    TermColor fg = TermColor::kNone;
    Attribute attr = Attribute::None;

    // Escape sequence that switches to this style; empty for plain text.
    std::string
    to_ansi() const;

    // `text` wrapped in this style and a reset.
    std::string
    apply(const std::string& text) const;
};

// Styles of the unified output; "[colors]" in the config file.
struct ColorScheme {
    TermStyle deleted{TermColor::kRed, TermStyle::Attribute::None};
    TermStyle inserted{TermColor::kGreen, TermStyle::Attribute::None};
    TermStyle marker{TermColor::kNone, TermStyle::Attribute::Dim};
};

std::string
repr(const TermColor& color);

}  // namespace nestdiff
