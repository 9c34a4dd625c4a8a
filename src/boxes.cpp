#include "boxes.hpp"

#include <algorithm>
#include <cctype>

namespace stderrx {

namespace {

constexpr BoxChars LIGHT = {
    "┌", "┐", "└", "┘", "─", "│", "┬", "┴", "├", "┤", "┼",
};

constexpr BoxChars HEAVY = {
    "┏", "┓", "┗", "┛", "━", "┃", "┳", "┻", "┣", "┫", "╋",
};

constexpr BoxChars DOUBLE = {
    "╔", "╗", "╚", "╝", "═", "║", "╦", "╩", "╠", "╣", "╬",
};

// Borderless: every glyph is a single blank column so layout is unchanged.
constexpr BoxChars NONE = {
    " ", " ", " ", " ", " ", " ", " ", " ", " ", " ", " ",
};

} // namespace

const char* to_string(BorderStyle style) {
    switch (style) {
        case BorderStyle::Light: return "light";
        case BorderStyle::Heavy: return "heavy";
        case BorderStyle::Double: return "double";
        case BorderStyle::None: return "none";
    }
    return "light";
}

bool parse_border_style(const std::string& name, BorderStyle& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "light") {
        out = BorderStyle::Light;
    } else if (lower == "heavy") {
        out = BorderStyle::Heavy;
    } else if (lower == "double") {
        out = BorderStyle::Double;
    } else if (lower == "none") {
        out = BorderStyle::None;
    } else {
        return false;
    }
    return true;
}

const BoxChars& BoxChars::from_style(BorderStyle style) {
    switch (style) {
        case BorderStyle::Light: return LIGHT;
        case BorderStyle::Heavy: return HEAVY;
        case BorderStyle::Double: return DOUBLE;
        case BorderStyle::None: return NONE;
    }
    return LIGHT;
}

} // namespace stderrx
