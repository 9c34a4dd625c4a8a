#pragma once

/**
 * Level glyphs and colors.
 *
 * Maps each semantic log level to the glyph shown in its prefix and the
 * palette color the line is drawn in. The glyphs for the common levels can
 * be overridden per logger; colors are fixed.
 */

#include <string>
#include <vector>

namespace stderrx {

enum class Level {
    Okay,
    Info,
    Note,
    Warn,
    Error,
    Debug,
    Trace,
    Magic,
    Silly,
    DevLog
};

// Lowercase level name ("okay", "info", ...).
const char* to_string(Level level);

/**
 * Customizable glyph set for the logging functions.
 *
 * note, silly and devlog are not configurable: note uses an arrow, silly uses
 * phi and devlog reuses the debug glyph.
 */
struct GlyphSet {
    std::string info = "λ";
    std::string warn = "△";
    std::string error = "✕";
    std::string okay = "✓";
    std::string trace = "…";
    std::string debug = "⌬";
    std::string magic = "↯";

    // Replaces the glyph for a level. Returns false for levels without a
    // configurable glyph.
    bool set(Level level, const std::string& glyph);

    // Glyph shown in the prefix of a message at this level.
    std::string glyph_for(Level level) const;

    bool operator==(const GlyphSet& other) const;
};

// Palette color a message at this level is drawn in.
int level_color(Level level);

// ========== Glyph Catalog ==========

// A named glyph from the curated catalog.
struct CatalogGlyph {
    const char* name;
    const char* glyph;
    char32_t codepoint;
};

// Curated collection of non-emoji glyphs for terminal UIs.
const std::vector<CatalogGlyph>& glyph_catalog();

} // namespace stderrx
