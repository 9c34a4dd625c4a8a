#include <catch2/catch.hpp>
#include "terminal.hpp"

using namespace stderrx;

// ============================================================================
// Display width
// ============================================================================

TEST_CASE("ASCII is one column per character", "[terminal]") {
    REQUIRE(terminal::display_width("") == 0);
    REQUIRE(terminal::display_width("hello") == 5);
}

TEST_CASE("Wide characters take two columns", "[terminal]") {
    REQUIRE(terminal::display_width("日本") == 4);
    REQUIRE(terminal::display_width("a日b") == 4);
    REQUIRE(terminal::display_width("データ") == 6);
}

TEST_CASE("Box drawing and flag glyphs are narrow", "[terminal]") {
    REQUIRE(terminal::display_width("┌──┐") == 4);
    REQUIRE(terminal::display_width("◉○") == 2);
    REQUIRE(terminal::display_width("λ") == 1);
}

TEST_CASE("Combining marks have no width", "[terminal]") {
    REQUIRE(terminal::display_width("e\xCC\x81") == 1);  // e + U+0301
}

TEST_CASE("ANSI escape sequences are skipped", "[terminal]") {
    REQUIRE(terminal::display_width("\033[31mred\033[0m") == 3);
    REQUIRE(terminal::display_width("\033[38;5;214mwarn\033[0m") == 4);
    REQUIRE(terminal::display_width("\033]8;;http://x\007link\033]8;;\007") == 4);
}

// ============================================================================
// Padding and truncation
// ============================================================================

TEST_CASE("pad_right pads to display width", "[terminal]") {
    REQUIRE(terminal::pad_right("ab", 4) == "ab  ");
    REQUIRE(terminal::pad_right("日", 4) == "日  ");
    REQUIRE(terminal::pad_right("toolong", 3) == "toolong");
}

TEST_CASE("pad_left right-aligns", "[terminal]") {
    REQUIRE(terminal::pad_left("7", 3) == "  7");
    REQUIRE(terminal::pad_left("日", 3) == " 日");
}

TEST_CASE("take_cols never splits a wide character", "[terminal]") {
    REQUIRE(terminal::take_cols("abcdef", 3) == "abc");
    REQUIRE(terminal::take_cols("日本語", 3) == "日");
    REQUIRE(terminal::take_cols("ab", 5) == "ab");
    REQUIRE(terminal::take_cols("ab", 0) == "");
}

TEST_CASE("repeat concatenates multi-byte strings", "[terminal]") {
    REQUIRE(terminal::repeat("─", 3) == "───");
    REQUIRE(terminal::repeat("x", 0) == "");
}

// ============================================================================
// Line splitting
// ============================================================================

TEST_CASE("split_lines ignores a trailing newline", "[terminal]") {
    REQUIRE(terminal::split_lines("a\nb\n") == std::vector<std::string>{"a", "b"});
    REQUIRE(terminal::split_lines("a\n\nb") == std::vector<std::string>{"a", "", "b"});
    REQUIRE(terminal::split_lines("").empty());
}
