#pragma once

#include <string>

namespace stderrx {

/**
 * Border style for boxes, tables and flag tables.
 * A style is applied to a whole rendered element, never mixed.
 * See https://en.wikipedia.org/wiki/Box-drawing_characters
 */
enum class BorderStyle {
    Light,
    Heavy,
    Double,
    None
};

// "light", "heavy", "double" or "none".
const char* to_string(BorderStyle style);

// Parses a style name (case-insensitive). Returns false if unknown.
bool parse_border_style(const std::string& name, BorderStyle& out);

// The full glyph set for one BorderStyle.
struct BoxChars {
    const char* top_left;
    const char* top_right;
    const char* bottom_left;
    const char* bottom_right;
    const char* horizontal;
    const char* vertical;
    const char* top_t;
    const char* bottom_t;
    const char* left_t;
    const char* right_t;
    const char* cross;

    // Creates a character set from a given BorderStyle.
    static const BoxChars& from_style(BorderStyle style);
};

} // namespace stderrx
