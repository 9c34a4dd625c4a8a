#include <catch2/catch.hpp>
#include "diag.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"

#include <optional>

using namespace stderrx;

namespace {

// Routes diagnostics into a collector for the lifetime of the test.
struct DiagCapture {
    OutputCollector output;

    DiagCapture() {
        set_diag_sink(output.sink());
        set_diagnostics(true);
    }
    ~DiagCapture() {
        set_diagnostics(false);
        set_diag_sink(stderr_sink());
    }
};

} // namespace

TEST_CASE("Diagnostic lines carry a timestamp and category", "[diag]") {
    DiagCapture capture;

    diag_err("trace", "frame released early");
    diag_log("config", "loaded");

    REQUIRE(capture.output.writes.size() == 2);
    CHECK_THAT(strip_ansi(capture.output.writes[0]),
               Catch::Matches(R"(\[\d\d:\d\d:\d\d\.\d{3}\] stderrx/trace error: frame released early\n)"));
    CHECK_THAT(strip_ansi(capture.output.writes[1]),
               Catch::EndsWith("] stderrx/config: loaded\n"));
}

TEST_CASE("Errors and plain lines are colored differently", "[diag]") {
    std::string error = diag_line("x", "m", true);
    std::string plain = diag_line("x", "m", false);

    CHECK(error.find(ansi::fg(palette::RED)) != std::string::npos);
    CHECK(plain.find(ansi::fg(palette::BLUE)) != std::string::npos);
    CHECK(strip_ansi(plain).find("stderrx/x: m") != std::string::npos);
}

TEST_CASE("Nothing is written while diagnostics are off", "[diag]") {
    DiagCapture capture;
    set_diagnostics(false);

    diag_err("trace", "hidden");
    diag_log("config", "hidden");

    CHECK(capture.output.writes.empty());
}

TEST_CASE("Out-of-order release is reported through the diagnostic sink", "[diag][trace]") {
    DiagCapture capture;
    OutputCollector output;
    Logger log(test_config(), output.sink());

    std::optional<TraceScope> outer(log.enter("outer"));
    TraceScope inner = log.enter("inner");
    outer.reset();

    REQUIRE(capture.output.writes.size() == 1);
    CHECK(strip_ansi(capture.output.result()).find("stderrx/trace error:") != std::string::npos);
    CHECK(output.writes.empty());
}
