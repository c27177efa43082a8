#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace textdiff {

struct TermColor {
    enum class Kind : uint8_t {
        Color4bit = 0,
        Color24bit,
        DefaultColor,
        Ignore,
        Reset
    };

    Kind kind;

    // SGR codes for 4 bit colors (r: foreground, g: background), rgb otherwise.
    uint8_t r;
    uint8_t g;
    uint8_t b;

    TermColor()
        : TermColor(Kind::Ignore, 0, 0, 0) {}

    TermColor(Kind kind, uint8_t r, uint8_t g, uint8_t b)
        : kind(kind)
        , r(r)
        , g(g)
        , b(b) {}

    bool operator == (const TermColor& other) const {
        return other.kind == kind && other.r == r && other.g == g && other.b == b;
    }

    // Parse color string; i.e:
    //   "#rgb", "#rrggbb"
    //   "green"
    static std::optional<TermColor>
    parse_string(const std::string& value);

    // #rgb, #rrggbb
    static std::optional<TermColor>
    parse_hex(const std::string& value);

    static const TermColor kNone;
    static const TermColor kReset;
    static const TermColor kDefault;

    // Colors (standard 4 bit palette)
    static const TermColor kBlack;
    static const TermColor kRed;
    static const TermColor kGreen;
    static const TermColor kYellow;
    static const TermColor kBlue;
    static const TermColor kMagenta;
    static const TermColor kCyan;
    static const TermColor kLightGray;
    static const TermColor kDarkGray;
    static const TermColor kLightRed;
    static const TermColor kLightGreen;
    static const TermColor kLightYellow;
    static const TermColor kLightBlue;
    static const TermColor kLightMagenta;
    static const TermColor kLightCyan;
    static const TermColor kWhite;
};

struct TermStyle {

    enum class Attribute : uint16_t {
        None          = 0,
        Bold          = 1 << 0,
        Dim           = 1 << 1,
        Italic        = 1 << 2,
        Underline     = 1 << 4,
        Inverse       = 1 << 6,
        Strikethrough = 1 << 8,
    };

    TermColor fg;
    Attribute attr;

    TermStyle()
        : fg()
        , attr(Attribute::None) {}

    explicit TermStyle(TermColor fg, Attribute attr = Attribute::None)
        : fg(fg)
        , attr(attr) {}

    bool operator == (const TermStyle& other) const {
        return other.fg == fg && other.attr == attr;
    }

    // Convert style to ansi escape sequence; empty if there's nothing to set.
    std::string
    to_ansi() const;

    // Parse a space separated list of attributes and at most one color,
    // e.g. "bold green" or "underline #ff8800". Empty means no styling.
    static std::optional<TermStyle>
    parse_string(const std::string& value);

    // Inverse of parse_string.
    std::string
    to_string() const;
};

// Escape sequence that resets color and attributes.
std::string
ansi_reset();

// Wrap text in the style's escape codes; returned as is when the style is empty.
std::string
colorize(const TermStyle& style, const std::string& text);

}  // namespace textdiff
