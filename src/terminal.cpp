#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstdlib>

namespace stderrx {
namespace terminal {

namespace {

struct Range {
    char32_t first;
    char32_t last;
};

// East Asian Wide (W) and Fullwidth (F) blocks.
constexpr Range WIDE_RANGES[] = {
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2329, 0x232A},   {0x23E9, 0x23EC},
    {0x23F0, 0x23F0},   {0x23F3, 0x23F3},   {0x25FD, 0x25FE},   {0x2614, 0x2615},
    {0x2648, 0x2653},   {0x267F, 0x267F},   {0x2693, 0x2693},   {0x26A1, 0x26A1},
    {0x26AA, 0x26AB},   {0x26BD, 0x26BE},   {0x26C4, 0x26C5},   {0x26CE, 0x26CE},
    {0x26D4, 0x26D4},   {0x26EA, 0x26EA},   {0x26F2, 0x26F3},   {0x26F5, 0x26F5},
    {0x26FA, 0x26FA},   {0x26FD, 0x26FD},   {0x2705, 0x2705},   {0x270A, 0x270B},
    {0x2728, 0x2728},   {0x274C, 0x274C},   {0x274E, 0x274E},   {0x2753, 0x2755},
    {0x2757, 0x2757},   {0x2795, 0x2797},   {0x27B0, 0x27B0},   {0x27BF, 0x27BF},
    {0x2B1B, 0x2B1C},   {0x2B50, 0x2B50},   {0x2B55, 0x2B55},   {0x2E80, 0x303E},
    {0x3041, 0x33FF},   {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},
    {0xA960, 0xA97F},   {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},   {0xFE10, 0xFE19},
    {0xFE30, 0xFE6F},   {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

// Combining marks and zero-width format characters.
constexpr Range ZERO_WIDTH_RANGES[] = {
    {0x0300, 0x036F}, {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200F},
    {0x2060, 0x2064}, {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
};

template <size_t N>
bool in_ranges(const Range (&ranges)[N], char32_t cp) {
    for (const auto& r : ranges) {
        if (cp < r.first) {
            return false;  // Sorted, nothing further can match.
        }
        if (cp <= r.last) {
            return true;
        }
    }
    return false;
}

// Decodes one UTF-8 sequence at text[i]. Returns the byte length consumed;
// malformed input decodes as a single byte.
size_t decode_utf8(const std::string& text, size_t i, char32_t& cp) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    size_t len = 1;
    if ((c & 0x80) == 0) {
        cp = c;
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        cp = c & 0x1F;
        len = 2;
    } else if ((c & 0xF0) == 0xE0) {
        cp = c & 0x0F;
        len = 3;
    } else if ((c & 0xF8) == 0xF0) {
        cp = c & 0x07;
        len = 4;
    } else {
        cp = c;
        return 1;
    }

    if (i + len > text.size()) {
        cp = c;
        return 1;
    }
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(text[i + k]);
        if ((cc & 0xC0) != 0x80) {
            cp = c;
            return 1;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    return len;
}

// Length in bytes of the escape sequence starting at text[i] (text[i] == ESC).
size_t escape_length(const std::string& text, size_t i) {
    size_t j = i + 1;
    if (j >= text.size()) {
        return 1;
    }

    if (text[j] == '[') {
        // CSI: parameters then a final byte in 0x40-0x7E
        j++;
        while (j < text.size() && (text[j] < '@' || text[j] > '~')) {
            j++;
        }
        return (j < text.size() ? j + 1 : j) - i;
    }

    if (text[j] == ']') {
        // OSC: terminated by BEL or ST (ESC \)
        j++;
        while (j < text.size()) {
            if (text[j] == '\007') {
                return j + 1 - i;
            }
            if (text[j] == '\033' && j + 1 < text.size() && text[j + 1] == '\\') {
                return j + 2 - i;
            }
            j++;
        }
        return j - i;
    }

    return 2;
}

} // namespace

int get_width() {
    struct winsize ws;
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }

    // Try COLUMNS environment variable
    const char* columns = std::getenv("COLUMNS");
    if (columns) {
        int width = std::atoi(columns);
        if (width > 0) {
            return width;
        }
    }

    // Default fallback
    return 80;
}

bool is_tty() {
    return isatty(STDERR_FILENO) != 0;
}

int codepoint_width(char32_t cp) {
    if (cp == 0 || cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
        return 0;
    }
    if (cp < 0x300) {
        return 1;
    }
    if (in_ranges(ZERO_WIDTH_RANGES, cp)) {
        return 0;
    }
    if (in_ranges(WIDE_RANGES, cp)) {
        return 2;
    }
    return 1;
}

int display_width(const std::string& text) {
    int width = 0;
    size_t i = 0;

    while (i < text.length()) {
        if (text[i] == '\033') {
            i += escape_length(text, i);
            continue;
        }

        char32_t cp = 0;
        i += decode_utf8(text, i, cp);
        width += codepoint_width(cp);
    }

    return width;
}

std::string take_cols(const std::string& text, int cols) {
    if (cols <= 0) {
        return "";
    }

    std::string out;
    out.reserve(text.size());
    int seen = 0;
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] == '\033') {
            size_t len = escape_length(text, i);
            out.append(text, i, len);
            i += len;
            continue;
        }

        char32_t cp = 0;
        size_t len = decode_utf8(text, i, cp);
        int w = codepoint_width(cp);
        if (seen + w > cols) {
            break;
        }
        out.append(text, i, len);
        seen += w;
        i += len;
    }

    return out;
}

std::string pad_right(const std::string& text, int width) {
    int w = display_width(text);
    if (w >= width) {
        return text;
    }
    return text + std::string(static_cast<size_t>(width - w), ' ');
}

std::string pad_left(const std::string& text, int width) {
    int w = display_width(text);
    if (w >= width) {
        return text;
    }
    return std::string(static_cast<size_t>(width - w), ' ') + text;
}

std::string repeat(const std::string& s, int n) {
    std::string result;
    if (n <= 0) {
        return result;
    }
    result.reserve(s.length() * static_cast<size_t>(n));
    for (int i = 0; i < n; i++) {
        result += s;
    }
    return result;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace terminal
} // namespace stderrx
