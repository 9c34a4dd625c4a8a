#include "grid.hpp"
#include "style.hpp"
#include "terminal.hpp"

#include <algorithm>
#include <cstdio>

namespace stderrx {
namespace grid {

using terminal::display_width;
using terminal::pad_left;
using terminal::pad_right;
using terminal::repeat;

Grid normalize(const Grid& rows) {
    size_t num_cols = 0;
    for (const auto& row : rows) {
        num_cols = std::max(num_cols, row.size());
    }

    Grid result = rows;
    for (auto& row : result) {
        row.resize(num_cols);
    }
    return result;
}

std::vector<int> column_widths(const Grid& rows) {
    Grid norm = normalize(rows);
    size_t num_cols = norm.empty() ? 0 : norm.front().size();

    std::vector<int> widths(num_cols, 0);
    for (const auto& row : norm) {
        for (size_t i = 0; i < num_cols; i++) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

Lines simple_table(const Grid& rows) {
    Lines lines;
    if (rows.empty()) {
        return lines;
    }

    Grid norm = normalize(rows);
    std::vector<int> widths = column_widths(norm);

    auto render_row = [&widths](const std::vector<std::string>& row) {
        std::string line;
        for (size_t i = 0; i < widths.size(); i++) {
            if (i > 0) {
                line += COLUMN_GAP;
            }
            line += pad_right(row[i], widths[i]);
        }
        return line;
    };

    lines.push_back(render_row(norm[0]));

    std::string separator;
    for (size_t i = 0; i < widths.size(); i++) {
        if (i > 0) {
            separator += COLUMN_GAP;
        }
        separator += std::string(static_cast<size_t>(widths[i]), '-');
    }
    lines.push_back(separator);

    for (size_t r = 1; r < norm.size(); r++) {
        lines.push_back(render_row(norm[r]));
    }
    return lines;
}

Result<Lines> columns(const std::vector<std::string>& items, size_t n) {
    if (n == 0) {
        return Result<Lines>::failure(ErrorKind::Layout, "column count must be at least 1");
    }

    std::vector<int> widths(n, 0);
    for (size_t i = 0; i < items.size(); i++) {
        widths[i % n] = std::max(widths[i % n], display_width(items[i]));
    }

    Lines lines;
    for (size_t start = 0; start < items.size(); start += n) {
        size_t count = std::min(n, items.size() - start);
        std::string line;
        for (size_t c = 0; c < count; c++) {
            const std::string& item = items[start + c];
            if (c + 1 < count) {
                line += pad_right(item, widths[c]) + COLUMN_GAP;
            } else {
                line += item;
            }
        }
        lines.push_back(line);
    }
    return lines;
}

Lines box(const std::string& text, BorderStyle style) {
    const BoxChars& chars = BoxChars::from_style(style);

    Lines content = terminal::split_lines(text);
    if (content.empty()) {
        content.push_back("");
    }

    int content_width = 0;
    for (const auto& line : content) {
        content_width = std::max(content_width, display_width(line));
    }
    int inner_width = content_width + 2 * BOX_PADDING;
    std::string pad(static_cast<size_t>(BOX_PADDING), ' ');

    Lines lines;
    lines.push_back(std::string(chars.top_left) + repeat(chars.horizontal, inner_width) + chars.top_right);
    for (const auto& line : content) {
        lines.push_back(std::string(chars.vertical) + pad + pad_right(line, content_width) + pad + chars.vertical);
    }
    lines.push_back(std::string(chars.bottom_left) + repeat(chars.horizontal, inner_width) + chars.bottom_right);
    return lines;
}

bool flag_is_set(const FlagSpec& spec, size_t pos) {
    if (pos >= spec.bit_width) {
        return false;
    }
    unsigned bit = spec.bit_width - 1 - static_cast<unsigned>(pos);
    return ((spec.value >> bit) & 1u) == 1u;
}

Result<Lines> flag_table(const FlagSpec& spec, BorderStyle style) {
    if (spec.bit_width > 64) {
        return Result<Lines>::failure(ErrorKind::Layout,
            "bit width " + std::to_string(spec.bit_width) + " exceeds 64");
    }
    if (spec.labels.size() > spec.bit_width) {
        return Result<Lines>::failure(ErrorKind::Layout,
            std::to_string(spec.labels.size()) + " labels exceed bit width " +
            std::to_string(spec.bit_width));
    }

    Lines lines;
    if (spec.bit_width == 0) {
        return lines;
    }

    const BoxChars& chars = BoxChars::from_style(style);
    const std::string h_four = repeat(chars.horizontal, 4);

    for (size_t start = 0; start < spec.bit_width; start += FLAG_CELLS_PER_ROW) {
        size_t count = std::min(FLAG_CELLS_PER_ROW, spec.bit_width - start);

        std::string top = chars.top_left;
        std::string mid = chars.left_t;
        std::string bot = chars.bottom_left;
        std::string index_row = chars.vertical;
        std::string value_row = chars.vertical;
        std::string label_row = chars.vertical;

        for (size_t k = 0; k < count; k++) {
            size_t pos = start + k;
            unsigned bit = spec.bit_width - 1 - static_cast<unsigned>(pos);

            if (k > 0) {
                top += chars.top_t;
                mid += chars.cross;
                bot += chars.bottom_t;
            }
            top += h_four;
            mid += h_four;
            bot += h_four;

            char index[8];
            std::snprintf(index, sizeof(index), "%02u", bit);
            index_row += std::string(" ") + index + " " + chars.vertical;

            value_row += std::string("  ") + (flag_is_set(spec, pos) ? FLAG_SET : FLAG_UNSET) + " " + chars.vertical;

            std::string label = pos < spec.labels.size() ? spec.labels[pos] : "";
            label_row += " " + pad_left(terminal::take_cols(label, 2), 2) + " " + chars.vertical;
        }

        top += chars.top_right;
        mid += chars.right_t;
        bot += chars.bottom_right;

        if (start > 0) {
            lines.push_back("");
        }
        lines.push_back(top);
        lines.push_back(index_row);
        lines.push_back(mid);
        lines.push_back(value_row);
        lines.push_back(label_row);
        lines.push_back(bot);
    }

    return lines;
}

std::string banner(const std::string& msg, const std::string& fill, int width,
                   const std::string& open, const std::string& close) {
    int msg_len = display_width(msg) + 2;  // one space on each side
    if (msg_len >= width) {
        return " " + open + msg + close + " ";
    }

    int total_fill = width - msg_len;
    int left_fill = total_fill / 2;
    int right_fill = total_fill - left_fill;
    return repeat(fill, left_fill) + " " + open + msg + close + " " + repeat(fill, right_fill);
}

std::string context_banner(const std::string& context, int width) {
    std::string msg = " Context: " + context + " ";
    int capped = std::min(width, CONTEXT_BANNER_MAX_WIDTH);
    int msg_len = display_width(msg);

    if (msg_len >= capped) {
        return "--- " + context + " ---";
    }

    int total_fill = capped - msg_len;
    int left_fill = total_fill / 2;
    int right_fill = total_fill - left_fill;
    return std::string(static_cast<size_t>(left_fill), '-') + msg +
           std::string(static_cast<size_t>(right_fill), '-');
}

namespace {

// Black or white text, whichever reads better on palette color i.
int contrast_fg(int i) {
    constexpr int BLACK_TEXT = 0;
    constexpr int WHITE_TEXT = 15;

    if (i < 16) {
        return (i == 0 || i == 8) ? WHITE_TEXT : BLACK_TEXT;
    }
    if (i < 232) {
        int r = ((i - 16) / 36) * 51;
        int g = (((i - 16) % 36) / 6) * 51;
        int b = ((i - 16) % 6) * 51;
        return (r + g + b) > 382 ? BLACK_TEXT : WHITE_TEXT;
    }
    // Grayscale ramp
    return i > 243 ? BLACK_TEXT : WHITE_TEXT;
}

} // namespace

Result<Lines> color_grid(int cols, bool colors) {
    if (cols <= 0) {
        return Result<Lines>::failure(ErrorKind::Layout, "color grid needs at least 1 column");
    }

    Lines lines;
    std::string line;
    for (int i = 0; i < 256; i++) {
        char cell[16];
        std::snprintf(cell, sizeof(cell), " %-3d .", i);

        if (colors) {
            line += ansi::bg(i) + ansi::fg(contrast_fg(i)) + cell + ansi::RESET;
        } else {
            line += cell;
        }

        if ((i + 1) % cols == 0) {
            lines.push_back(line);
            line.clear();
        }
    }
    if (!line.empty()) {
        lines.push_back(line);
    }
    return lines;
}

Lines bullet_list(const std::vector<std::string>& items, const std::string& bullet) {
    Lines lines;
    for (const auto& item : items) {
        lines.push_back(bullet + " " + item);
    }
    return lines;
}

Lines numbered_list(const std::vector<std::string>& items) {
    Lines lines;
    for (size_t i = 0; i < items.size(); i++) {
        lines.push_back(std::to_string(i + 1) + ". " + items[i]);
    }
    return lines;
}

std::string join(const Lines& lines) {
    std::string result;
    for (const auto& line : lines) {
        result += line;
        result += '\n';
    }
    return result;
}

} // namespace grid
} // namespace stderrx
