#include "glyphs.hpp"
#include "style.hpp"

namespace stderrx {

const char* to_string(Level level) {
    switch (level) {
        case Level::Okay: return "okay";
        case Level::Info: return "info";
        case Level::Note: return "note";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Debug: return "debug";
        case Level::Trace: return "trace";
        case Level::Magic: return "magic";
        case Level::Silly: return "silly";
        case Level::DevLog: return "devlog";
    }
    return "unknown";
}

bool GlyphSet::set(Level level, const std::string& glyph) {
    switch (level) {
        case Level::Info: info = glyph; return true;
        case Level::Warn: warn = glyph; return true;
        case Level::Error: error = glyph; return true;
        case Level::Okay: okay = glyph; return true;
        case Level::Trace: trace = glyph; return true;
        case Level::Debug: debug = glyph; return true;
        case Level::Magic: magic = glyph; return true;
        default:
            return false;
    }
}

std::string GlyphSet::glyph_for(Level level) const {
    switch (level) {
        case Level::Okay: return okay;
        case Level::Info: return info;
        case Level::Note: return "→";
        case Level::Warn: return warn;
        case Level::Error: return error;
        case Level::Debug: return debug;
        case Level::Trace: return trace;
        case Level::Magic: return magic;
        case Level::Silly: return "φ";
        case Level::DevLog: return debug;
    }
    return info;
}

bool GlyphSet::operator==(const GlyphSet& other) const {
    return info == other.info && warn == other.warn && error == other.error &&
           okay == other.okay && trace == other.trace && debug == other.debug &&
           magic == other.magic;
}

int level_color(Level level) {
    switch (level) {
        case Level::Okay: return palette::GREEN;
        case Level::Info: return palette::BLUE;
        case Level::Note: return palette::BLUE;
        case Level::Warn: return palette::ORANGE;
        case Level::Error: return palette::RED;
        case Level::Debug: return palette::CYAN;
        case Level::Trace: return palette::GREY;
        case Level::Magic: return palette::PURPLE;
        case Level::Silly: return palette::MAGENTA;
        case Level::DevLog: return palette::RED2;
    }
    return palette::WHITE;
}

const std::vector<CatalogGlyph>& glyph_catalog() {
    static const std::vector<CatalogGlyph> catalog = {
        // General
        {"Usage", "❖", 0x2756},
        {"Cmdr", "⌘", 0x2318},
        {"Boto", "⌬", 0x232C},
        {"Gear", "⛭", 0x26ED},
        {"Info", "◎", 0x25CE},
        {"Ellipsis", "…", 0x2026},

        // Status
        {"Pass", "✓", 0x2713},
        {"Fail", "✕", 0x2715},
        {"Mark", "⤬", 0x292C},
        {"FlagOff", "⚐", 0x2690},
        {"FlagOn", "⚑", 0x2691},
        {"Bolt", "↯", 0x21AF},
        {"Anchor", "⚓", 0x2693},

        // Bullets and pointers
        {"Bullet", "•", 0x2022},
        {"Dot", "∙", 0x2219},
        {"RadioOn", "◉", 0x25C9},
        {"RadioOff", "○", 0x25CB},
        {"SquareSmall", "▫", 0x25AB},
        {"Pointer", "▶", 0x25B6},

        // Arrows
        {"Up", "↑", 0x2191},
        {"Down", "↓", 0x2193},
        {"Right", "→", 0x2192},
        {"Left", "←", 0x2190},
        {"HeavyArrowRight", "➜", 0x279C},
        {"DownArr", "↳", 0x21B3},
        {"UpArr", "↱", 0x21B1},
        {"ReturnSymbol", "↩", 0x21A9},

        // Actions and time
        {"Undo", "⎌", 0x238C},
        {"Recover", "⟲", 0x27F2},
        {"RedoClosed", "⟳", 0x27F3},
        {"Hourglass", "⧖", 0x29D6},

        // Miscellaneous
        {"Rook", "♜", 0x265C},
        {"Delta", "△", 0x25B3},
        {"TriDown", "▽", 0x25BD},
        {"Star", "★", 0x2605},
        {"Spark", "✻", 0x273B},
        {"Therefore", "∴", 0x2234},
        {"Bullseye", "⦿", 0x29BF},
        {"Sect", "§", 0x00A7},
        {"Sum", "∑", 0x2211},
        {"Note", "♪", 0x266A},
        {"Spindle", "⟐", 0x27D0},

        // Greek
        {"Alpha", "α", 0x03B1},
        {"Beta", "β", 0x03B2},
        {"Lambda", "λ", 0x03BB},
        {"Pi", "π", 0x03C0},
        {"Sigma", "σ", 0x03C3},
        {"Phi", "φ", 0x03C6},
        {"Omega", "ω", 0x03C9},

        // Box drawing
        {"HLine", "─", 0x2500},
        {"VLine", "│", 0x2502},
        {"TRight", "├", 0x251C},
        {"CornerUr", "└", 0x2514},
    };
    return catalog;
}

} // namespace stderrx
