#pragma once

/**
 * Grid layout shared by tables, column layouts, boxes and flag tables.
 *
 * Every function here is pure: it takes cells or text and returns the
 * rendered lines (without trailing newlines). Widths are measured in
 * terminal display columns, so multi-byte and wide characters line up.
 * For a fixed input and style the output is byte-identical across runs.
 */

#include "boxes.hpp"
#include "status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stderrx {

using Lines = std::vector<std::string>;

// Rows of text cells. Rows may be ragged.
using Grid = std::vector<std::vector<std::string>>;

/**
 * A bitmask to display as a flag table.
 *
 * labels[0] names the most significant of the bit_width bits, labels[1] the
 * next one down, and so on. Missing labels are shown blank.
 */
struct FlagSpec {
    unsigned bit_width = 0;
    std::vector<std::string> labels;
    std::uint64_t value = 0;
};

namespace grid {

constexpr int BOX_PADDING = 1;                 // Blank columns on each side of box content.
constexpr size_t FLAG_CELLS_PER_ROW = 8;       // Flag cells per row group.
constexpr int CONTEXT_BANNER_MAX_WIDTH = 60;
constexpr const char* COLUMN_GAP = "  ";
constexpr const char* FLAG_SET = "◉";
constexpr const char* FLAG_UNSET = "○";

// Pads every row with empty cells up to the longest row length.
Grid normalize(const Grid& rows);

// Display width of the widest cell in each column (ragged rows padded).
std::vector<int> column_widths(const Grid& rows);

/**
 * First row is the header, followed by a '-' separator and the body rows.
 * Cells are right-padded to their column width and joined by two spaces.
 */
Lines simple_table(const Grid& rows);

/**
 * Lays items out row-major into n columns. Each column is as wide as its
 * widest item; a short final row is left-aligned with missing cells blank.
 * Fails with a Layout error when n is zero.
 */
Result<Lines> columns(const std::vector<std::string>& items, size_t n);

/**
 * Draws text inside a border. Lines are split on '\n' and padded to the
 * widest line plus BOX_PADDING on each side.
 */
Lines box(const std::string& text, BorderStyle style);

/**
 * Renders the bits of spec.value most-significant first, one cell per bit
 * showing the bit index, a set/unset marker and the label. Cells are grouped
 * FLAG_CELLS_PER_ROW to a row group.
 *
 * Fails with a Layout error if there are more labels than bits or the width
 * exceeds 64.
 */
Result<Lines> flag_table(const FlagSpec& spec, BorderStyle style);

// True if the cell at display position pos (0 = most significant) is set.
bool flag_is_set(const FlagSpec& spec, size_t pos);

/**
 * Centers msg between two runs of fill to the given width.
 * open/close wrap the message (e.g. color codes) without affecting layout.
 */
std::string banner(const std::string& msg, const std::string& fill, int width,
                   const std::string& open = "", const std::string& close = "");

// " Context: <context> " centered in '-' fill, width capped at 60.
std::string context_banner(const std::string& context, int width);

/**
 * Swatch grid of the 256 palette colors, cols cells per line.
 * Fails with a Layout error when cols is zero.
 */
Result<Lines> color_grid(int cols, bool colors);

// "<bullet> item" per item.
Lines bullet_list(const std::vector<std::string>& items, const std::string& bullet);

// "1. item", "2. item", ...
Lines numbered_list(const std::vector<std::string>& items);

// Joins lines, terminating each with '\n'.
std::string join(const Lines& lines);

} // namespace grid
} // namespace stderrx
