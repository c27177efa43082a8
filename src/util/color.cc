#include "color.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <tuple>
#include <vector>

using namespace textdiff;

// clang-format off
const std::array<std::tuple<const TermStyle::Attribute, const std::string, int>, 6> kAttributes {{
    { TermStyle::Attribute::Bold,          "bold",          1 },
    { TermStyle::Attribute::Dim,           "dim",           2 },
    { TermStyle::Attribute::Italic,        "italic",        3 },
    { TermStyle::Attribute::Underline,     "underline",     4 },
    { TermStyle::Attribute::Inverse,       "inverse",       7 },
    { TermStyle::Attribute::Strikethrough, "strikethrough", 9 }
}};

// Special colors for default colors and for resetting colors + attributes.
const TermColor TermColor::kNone    = TermColor {TermColor::Kind::Ignore, 0, 0, 0};
const TermColor TermColor::kReset   = TermColor {TermColor::Kind::Reset, 0, 0, 0};
const TermColor TermColor::kDefault = TermColor {TermColor::Kind::DefaultColor, 39, 49, 0};

// Color identifiers for 4 bit terminals.
const TermColor TermColor::kBlack        = TermColor { TermColor::Kind::Color4bit, 30,  40, 0 };
const TermColor TermColor::kRed          = TermColor { TermColor::Kind::Color4bit, 31,  41, 0 };
const TermColor TermColor::kGreen        = TermColor { TermColor::Kind::Color4bit, 32,  42, 0 };
const TermColor TermColor::kYellow       = TermColor { TermColor::Kind::Color4bit, 33,  43, 0 };
const TermColor TermColor::kBlue         = TermColor { TermColor::Kind::Color4bit, 34,  44, 0 };
const TermColor TermColor::kMagenta      = TermColor { TermColor::Kind::Color4bit, 35,  45, 0 };
const TermColor TermColor::kCyan         = TermColor { TermColor::Kind::Color4bit, 36,  46, 0 };
const TermColor TermColor::kLightGray    = TermColor { TermColor::Kind::Color4bit, 37,  47, 0 };
const TermColor TermColor::kDarkGray     = TermColor { TermColor::Kind::Color4bit, 90, 100, 0 };
const TermColor TermColor::kLightRed     = TermColor { TermColor::Kind::Color4bit, 91, 101, 0 };
const TermColor TermColor::kLightGreen   = TermColor { TermColor::Kind::Color4bit, 92, 102, 0 };
const TermColor TermColor::kLightYellow  = TermColor { TermColor::Kind::Color4bit, 93, 103, 0 };
const TermColor TermColor::kLightBlue    = TermColor { TermColor::Kind::Color4bit, 94, 104, 0 };
const TermColor TermColor::kLightMagenta = TermColor { TermColor::Kind::Color4bit, 95, 105, 0 };
const TermColor TermColor::kLightCyan    = TermColor { TermColor::Kind::Color4bit, 96, 106, 0 };
const TermColor TermColor::kWhite        = TermColor { TermColor::Kind::Color4bit, 97, 107, 0 };
// clang-format on

namespace {

// Function-local so that the palette is never read before the colors above
// have been initialized.
const std::vector<std::tuple<std::string, TermColor>>&
palette() {
    // clang-format off
    static const std::vector<std::tuple<std::string, TermColor>> kPalette = {
        { "default",       TermColor::kDefault },
        { "black",         TermColor::kBlack },
        { "red",           TermColor::kRed },
        { "green",         TermColor::kGreen },
        { "yellow",        TermColor::kYellow },
        { "blue",          TermColor::kBlue },
        { "magenta",       TermColor::kMagenta },
        { "cyan",          TermColor::kCyan },
        { "light_gray",    TermColor::kLightGray },
        { "dark_gray",     TermColor::kDarkGray },
        { "gray",          TermColor::kDarkGray },
        { "light_red",     TermColor::kLightRed },
        { "light_green",   TermColor::kLightGreen },
        { "light_yellow",  TermColor::kLightYellow },
        { "light_blue",    TermColor::kLightBlue },
        { "light_magenta", TermColor::kLightMagenta },
        { "light_cyan",    TermColor::kLightCyan },
        { "white",         TermColor::kWhite },
    };
    // clang-format on
    return kPalette;
}

}  // namespace

std::optional<TermColor>
TermColor::parse_hex(const std::string& s) {
    // Hex code parser that supports '#FFF' and '#FE83EE'
    if (!((s.size() == 4 || s.size() == 7) && s[0] == '#')) {
        return {};
    }

    for (std::size_t i = 1; i < s.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return {};
        }
    }

    long color24 = strtol(&s[1], nullptr, 16);
    if (s.size() == 4) {
        // '#ABC' is short for '#AABBCC'
        auto r = static_cast<uint8_t>(((color24 >> 8) & 0x0F) * 17);
        auto g = static_cast<uint8_t>(((color24 >> 4) & 0x0F) * 17);
        auto b = static_cast<uint8_t>(((color24 >> 0) & 0x0F) * 17);
        return TermColor(TermColor::Kind::Color24bit, r, g, b);
    }

    auto r = static_cast<uint8_t>((color24 >> 16) & 0xFF);
    auto g = static_cast<uint8_t>((color24 >> 8) & 0xFF);
    auto b = static_cast<uint8_t>((color24 >> 0) & 0xFF);
    return TermColor(TermColor::Kind::Color24bit, r, g, b);
}

std::optional<TermColor>
TermColor::parse_string(const std::string& s) {
    if (s.empty()) {
        return {};
    }

    // Is it a palette color?
    for (const auto& [name, color] : palette()) {
        if (name == s) {
            return color;
        }
    }

    return parse_hex(s);
}

std::string
TermStyle::to_ansi() const {
    // https://gist.github.com/fnky/458719343aabd01cfb17a3a4f7296797
    std::vector<int> escseq;

    switch (fg.kind) {
        // ESC[38;2;{r};{g};{b}m  Set foreground color as RGB.
        case TermColor::Kind::Color24bit: {
            escseq.insert(escseq.end(), {38, 2, fg.r, fg.g, fg.b});
        } break;

        // ESC[{ID}m  Set foreground color
        case TermColor::Kind::DefaultColor:
        case TermColor::Kind::Color4bit: {
            escseq.push_back(fg.r);
        } break;
        case TermColor::Kind::Reset: {
            escseq.push_back(0);
        } break;
        case TermColor::Kind::Ignore: {
        } break;
    }

    for (const auto& [attr_flag, attr_name, attr_code] : kAttributes) {
        if ((uint16_t) attr & (uint16_t) attr_flag) {
            escseq.push_back(attr_code);
        }
    }

    if (escseq.empty()) {
        return {};
    }

    std::string result = "\033[";
    for (const int code : escseq) {
        result += fmt::format("{};", code);
    }
    result.back() = 'm';
    return result;
}

std::optional<TermStyle>
TermStyle::parse_string(const std::string& value) {
    TermStyle style;
    uint16_t attributes = 0;
    bool has_color = false;

    std::istringstream words(value);
    std::string word;
    while (words >> word) {
        auto attr_it = std::find_if(kAttributes.begin(), kAttributes.end(),
                                    [&](const auto& attribute) { return std::get<1>(attribute) == word; });
        if (attr_it != kAttributes.end()) {
            attributes |= (uint16_t) std::get<0>(*attr_it);
            continue;
        }

        auto color = TermColor::parse_string(word);
        if (!color || has_color) {
            return {};
        }
        style.fg = *color;
        has_color = true;
    }

    style.attr = (Attribute) attributes;
    return style;
}

std::string
TermStyle::to_string() const {
    std::vector<std::string> words;
    for (const auto& [attr_flag, attr_name, attr_code] : kAttributes) {
        if ((uint16_t) attr & (uint16_t) attr_flag) {
            words.push_back(attr_name);
        }
    }

    if (fg.kind == TermColor::Kind::Color24bit) {
        words.push_back(fmt::format("#{:02x}{:02x}{:02x}", fg.r, fg.g, fg.b));
    } else {
        for (const auto& [name, color] : palette()) {
            if (color == fg) {
                words.push_back(name);
                break;
            }
        }
    }

    std::string result;
    for (const auto& w : words) {
        if (!result.empty()) {
            result += ' ';
        }
        result += w;
    }
    return result;
}

std::string
textdiff::ansi_reset() {
    return TermStyle{TermColor::kReset}.to_ansi();
}

std::string
textdiff::colorize(const TermStyle& style, const std::string& text) {
    auto start = style.to_ansi();
    if (start.empty()) {
        return text;
    }
    return start + text + ansi_reset();
}
