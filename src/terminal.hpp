#pragma once

#include <string>
#include <vector>

namespace stderrx {
namespace terminal {

/**
 * Get the width in columns of the terminal attached to stderr.
 * Falls back to $COLUMNS, then 80.
 */
int get_width();

/**
 * Check if stderr is a TTY (interactive terminal).
 */
bool is_tty();

/**
 * Display width in columns of a single Unicode code point.
 * Wide and fullwidth East Asian characters take 2 columns, combining
 * marks and zero-width characters take 0, everything else 1.
 */
int codepoint_width(char32_t cp);

/**
 * Calculate the display width of a string, accounting for
 * ANSI escape sequences (which have zero width) and
 * multi-byte UTF-8 characters.
 *
 * The result does not depend on the process locale.
 *
 * @param text The text to measure
 * @return Display width in columns
 */
int display_width(const std::string& text);

/**
 * Longest prefix of text that fits in the given number of columns.
 * ANSI escape sequences are copied through without being counted.
 */
std::string take_cols(const std::string& text, int cols);

// Pads text with spaces on the right up to width columns.
std::string pad_right(const std::string& text, int width);

// Pads text with spaces on the left up to width columns.
std::string pad_left(const std::string& text, int width);

// Repeats a (possibly multi-byte) string n times.
std::string repeat(const std::string& s, int n);

/**
 * Split text on '\n'. A trailing newline does not produce an extra empty
 * line; empty text yields no lines.
 */
std::vector<std::string> split_lines(const std::string& text);

} // namespace terminal
} // namespace stderrx
