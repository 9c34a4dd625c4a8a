#include <catch2/catch.hpp>
#include "global_logger.hpp"
#include "logger.hpp"
#include "terminal.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <stdexcept>

using namespace stderrx;

namespace {

struct Row {
    std::string name;
    int count;

    std::vector<std::string> columns() const {
        return {name, std::to_string(count)};
    }
};

} // namespace

// ============================================================================
// Message format
// ============================================================================

TEST_CASE("Messages are prefixed with their glyph", "[logger]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.info("hello"));
    CHECK(log.warn("careful"));
    CHECK(log.error("broken"));
    CHECK(log.okay("done"));
    CHECK(log.note("fyi"));

    std::vector<std::string> expected = {
        "[λ] hello",
        "[△] careful",
        "[✕] broken",
        "[✓] done",
        "[→] fyi",
    };
    REQUIRE(lines_of(output.result()) == expected);
    REQUIRE(output.writes.size() == 5);
}

TEST_CASE("A label goes before the glyph", "[logger]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    log.set_label("app");
    CHECK(log.info("started"));
    log.clear_label();
    CHECK(log.info("plain"));

    std::vector<std::string> expected = {"[app][λ] started", "[λ] plain"};
    REQUIRE(lines_of(output.result()) == expected);
}

TEST_CASE("Glyphs can be overridden", "[logger][glyphs]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    REQUIRE(log.set_glyph(Level::Info, "i"));
    REQUIRE_FALSE(log.set_glyph(Level::Note, "n"));
    CHECK(log.info("custom"));
    CHECK(log.note("fixed"));

    std::vector<std::string> expected = {"[i] custom", "[→] fixed"};
    REQUIRE(lines_of(output.result()) == expected);
}

TEST_CASE("Devlog reuses the debug glyph", "[logger][glyphs]") {
    GlyphSet glyphs;
    glyphs.debug = "D";
    CHECK(glyphs.glyph_for(Level::DevLog) == "D");
    CHECK(glyphs.glyph_for(Level::Silly) == "φ");
}

TEST_CASE("Colors wrap the line when enabled", "[logger][colors]") {
    OutputCollector output;
    Config config = test_config();
    config.color = ColorMode::Always;
    Logger log(config, output.sink());

    CHECK(log.warn("hot"));

    std::string out = output.result();
    CHECK(out.find("\033[38;5;214m") != std::string::npos);
    CHECK(strip_ansi(out) == "[△] hot\n");
}

TEST_CASE("No escape codes when colors are off", "[logger][colors]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.error("x"));
    CHECK(log.boxed("x"));
    CHECK(output.result().find('\033') == std::string::npos);
}

// ============================================================================
// Verbosity gates
// ============================================================================

TEST_CASE("Optional levels are off by default", "[logger][gate]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.debug("d"));
    CHECK(log.trace("t"));
    CHECK(log.silly("s"));
    CHECK(log.magic("m"));
    CHECK(log.devlog("v"));

    REQUIRE(output.writes.empty());
}

TEST_CASE("Flags enable their levels", "[logger][gate]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    log.set_debug(true);
    log.set_silly(true);
    log.set_dev(true);
    log.set_trace(true);

    CHECK(log.debug("d"));
    CHECK(log.silly("s"));
    CHECK(log.magic("m"));
    CHECK(log.devlog("v"));
    CHECK(log.trace("t"));

    std::vector<std::string> expected = {"[⌬] d", "[φ] s", "[↯] m", "[⌬] v", "[…] t"};
    REQUIRE(lines_of(output.result()) == expected);
}

TEST_CASE("Quiet keeps only errors and okay", "[logger][gate]") {
    OutputCollector output;
    Config config = test_config();
    config.quiet = true;
    config.debug = true;
    config.trace = true;
    config.silly = true;
    config.dev = true;
    Logger log(config, output.sink());

    CHECK(log.info("i"));
    CHECK(log.note("n"));
    CHECK(log.warn("w"));
    CHECK(log.debug("d"));
    CHECK(log.trace("t"));
    CHECK(log.silly("s"));
    CHECK(log.magic("m"));
    CHECK(log.devlog("v"));
    CHECK(log.inspect(Level::Silly, 1));
    CHECK(log.banner("b"));
    CHECK(log.boxed("b"));
    CHECK(log.print("p"));
    CHECK(log.error("e"));
    CHECK(log.okay("o"));

    std::vector<std::string> expected = {"[✕] e", "[✓] o"};
    REQUIRE(lines_of(output.result()) == expected);
}

TEST_CASE("enabled reports the gate", "[logger][gate]") {
    Config config = test_config();
    config.debug = true;
    Logger log(config, [](const std::string&) { return true; });

    CHECK(log.enabled(Level::Error));
    CHECK(log.enabled(Level::Info));
    CHECK(log.enabled(Level::Debug));
    CHECK_FALSE(log.enabled(Level::Trace));

    log.set_quiet(true);
    CHECK(log.enabled(Level::Okay));
    CHECK_FALSE(log.enabled(Level::Info));
    CHECK_FALSE(log.enabled(Level::Debug));
}

// ============================================================================
// Sink failures
// ============================================================================

TEST_CASE("A failing sink gives an Io status", "[logger][io]") {
    OutputCollector output;
    output.fail = true;
    Logger log(test_config(), output.sink());

    Status status = log.error("lost");
    REQUIRE_FALSE(status);
    CHECK(status.kind() == ErrorKind::Io);

    CHECK(log.boxed("lost").kind() == ErrorKind::Io);
}

TEST_CASE("A missing sink gives an Io status", "[logger][io]") {
    Logger log(test_config(), Sink());

    Status status = log.okay("nowhere");
    REQUIRE_FALSE(status);
    CHECK(status.kind() == ErrorKind::Io);
}

TEST_CASE("A stream that throws on failure gives an Io status", "[logger][io]") {
    RejectingBuf buf;
    std::ostream out(&buf);
    out.exceptions(std::ios::badbit);
    Logger log(test_config(), stream_sink(out));

    Status status = log.info("x");
    REQUIRE_FALSE(status);
    CHECK(status.kind() == ErrorKind::Io);
    CHECK(log.boxed("y").kind() == ErrorKind::Io);
}

TEST_CASE("A sink that throws gives an Io status", "[logger][io]") {
    Logger log(test_config(), [](const std::string&) -> bool {
        throw std::runtime_error("disk full");
    });

    Status status = log.error("x");
    REQUIRE_FALSE(status);
    CHECK(status.kind() == ErrorKind::Io);
    CHECK(status.message().find("disk full") != std::string::npos);
}

TEST_CASE("Suppressed output never touches the sink", "[logger][io]") {
    OutputCollector output;
    output.fail = true;
    Logger log(test_config(), output.sink());

    CHECK(log.debug("hidden"));
}

// ============================================================================
// Pretty-debug output
// ============================================================================

TEST_CASE("inspect prints values in one write", "[logger][inspect]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    nlohmann::json value = {{"a", 1}, {"b", {1, 2}}};
    CHECK(log.inspect(Level::Info, value));
    CHECK(log.inspect(Level::Info, std::vector<int>{1, 2, 3}));

    REQUIRE(output.writes.size() == 2);
    CHECK(output.writes[0].rfind("[λ] {\n  \"a\": 1,", 0) == 0);
    CHECK(output.writes[1] == "[λ] [1, 2, 3]\n");
}

TEST_CASE("inspect respects the gate", "[logger][inspect]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.inspect(Level::Debug, 42));
    CHECK(output.writes.empty());
}

// ============================================================================
// Formatting
// ============================================================================

TEST_CASE("Banner spans the configured width", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.banner("Title"));

    auto lines = lines_of(output.result());
    REQUIRE(lines.size() == 1);
    CHECK(terminal::display_width(lines[0]) == 40);
    CHECK(lines[0].find(" Title ") != std::string::npos);
    CHECK(lines[0].front() == '=');
}

TEST_CASE("Boxes are written in one piece", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.box_heavy("one\ntwo"));
    CHECK(log.help("usage"));

    REQUIRE(output.writes.size() == 2);
    CHECK(lines_of(output.writes[0]).size() == 4);
    CHECK(output.writes[1].rfind("┌", 0) == 0);
}

TEST_CASE("Tables from row objects", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    std::vector<Row> rows = {{"alpha", 3}, {"b", 12}};
    CHECK(log.table({"Name", "Count"}, rows));

    std::vector<std::string> expected = {
        "Name   Count",
        "-----  -----",
        "alpha  3    ",
        "b      12   ",
    };
    REQUIRE(lines_of(output.result()) == expected);
    REQUIRE(output.writes.size() == 1);
}

TEST_CASE("Quiet tables write nothing", "[logger][format][gate]") {
    OutputCollector output;
    Config config = test_config();
    config.quiet = true;
    Logger log(config, output.sink());

    std::vector<Row> rows = {{"alpha", 3}};
    CHECK(log.table({"Name", "Count"}, rows));
    CHECK(log.simple_table({{"a", "b"}}));
    REQUIRE(output.writes.empty());
}

TEST_CASE("Layout errors come back without output", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.columns({"a"}, 0).kind() == ErrorKind::Layout);
    CHECK(log.color_grid(0).kind() == ErrorKind::Layout);

    FlagSpec spec;
    spec.bit_width = 1;
    spec.labels = {"A", "B"};
    CHECK(log.flag_table(spec).kind() == ErrorKind::Layout);

    REQUIRE(output.writes.empty());
}

TEST_CASE("Lists and columns", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.bullet_list({"x", "y"}));
    CHECK(log.numbered_list({"z"}));
    CHECK(log.columns({"a", "b", "c"}, 2));

    std::vector<std::string> expected = {"• x", "• y", "1. z", "a  b", "c"};
    REQUIRE(lines_of(output.result()) == expected);
}

TEST_CASE("Glyph catalog lists every glyph", "[logger][format]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.glyph_catalog(1));

    REQUIRE(output.writes.size() == 1);
    CHECK(lines_of(output.result()).size() == glyph_catalog().size());
    CHECK(output.result().find("U+03BB") != std::string::npos);
}

TEST_CASE("print and newline", "[logger]") {
    OutputCollector output;
    Logger log(test_config(), output.sink());

    CHECK(log.print("raw"));
    CHECK(log.newline());

    REQUIRE(output.result() == "raw\n\n");
}

// ============================================================================
// Global logger
// ============================================================================

TEST_CASE("Global logger is a single instance", "[logger][global]") {
    Logger& a = global_logger();
    Logger& b = global_logger();
    REQUIRE(&a == &b);
}
