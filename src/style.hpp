#pragma once

#include <string>

namespace stderrx {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal styles.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* ITALIC = "\033[3m";
    constexpr const char* INVERT = "\033[7m";

    // Foreground color from the 256-color palette.
    inline std::string fg(int color) {
        return "\033[38;5;" + std::to_string(color) + "m";
    }

    // Background color from the 256-color palette.
    inline std::string bg(int color) {
        return "\033[48;5;" + std::to_string(color) + "m";
    }
}

// ========== Palette ==========

// 256-color palette indices used for level prefixes and decorations.
namespace palette {
    constexpr int VOID = 61;
    constexpr int FOREST = 60;
    constexpr int OCEAN = 17;
    constexpr int RED = 1;
    constexpr int RED2 = 197;
    constexpr int BLUE = 6;  // Terminal cyan
    constexpr int BLUE2 = 39;
    constexpr int YELLOW = 11;
    constexpr int ORANGE = 214;
    constexpr int GREEN = 10;
    constexpr int GREEN2 = 156;
    constexpr int CYAN = 51;
    constexpr int PURPLE = 213;
    constexpr int PURPLE2 = 141;
    constexpr int BLACK0 = 0;
    constexpr int BLACK = 235;
    constexpr int WHITE = 247;
    constexpr int WHITE2 = 15;
    constexpr int GREY = 242;
    constexpr int GREY2 = 240;
    constexpr int MAGENTA = 13;
    constexpr int MAGENTA2 = 198;
    constexpr int PINK = 211;
}

} // namespace stderrx
