#include <catch2/catch.hpp>
#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace stderrx;

namespace fs = std::filesystem;

namespace {

// Temporary file path removed when the test ends.
class TempPath {
public:
    explicit TempPath(const std::string& name)
        : path_((fs::temp_directory_path() / name).string()) {
        fs::remove(path_);
    }
    ~TempPath() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const std::string& str() const { return path_; }

private:
    std::string path_;
};

void clear_mode_env() {
    unsetenv(ENV_QUIET);
    unsetenv(ENV_DEBUG);
    unsetenv(ENV_TRACE);
    unsetenv(ENV_SILLY);
    unsetenv(ENV_DEV);
}

} // namespace

// ============================================================================
// Environment
// ============================================================================

TEST_CASE("No mode variables means default verbosity", "[config][env]") {
    clear_mode_env();
    Config config = Config::from_env();

    CHECK_FALSE(config.quiet);
    CHECK_FALSE(config.debug);
    CHECK_FALSE(config.trace);
    CHECK_FALSE(config.silly);
    CHECK_FALSE(config.dev);
}

TEST_CASE("A set mode variable enables its flag", "[config][env]") {
    clear_mode_env();
    setenv(ENV_DEBUG, "1", 1);
    setenv(ENV_SILLY, "", 1);

    Config config = Config::from_env();
    clear_mode_env();

    CHECK(config.debug);
    CHECK(config.silly);
    CHECK_FALSE(config.trace);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("Color modes parse case-insensitively", "[config]") {
    ColorMode mode = ColorMode::Auto;
    REQUIRE(parse_color_mode("NEVER", mode));
    CHECK(mode == ColorMode::Never);
    REQUIRE(parse_color_mode("always", mode));
    CHECK(mode == ColorMode::Always);
    REQUIRE_FALSE(parse_color_mode("sometimes", mode));
    CHECK(mode == ColorMode::Always);
}

// ============================================================================
// Config files
// ============================================================================

TEST_CASE("Missing config file loads nothing", "[config][file]") {
    TempPath path("stderrx_missing.json");
    REQUIRE_FALSE(load_config(path.str()).has_value());
}

TEST_CASE("Config survives a save and load", "[config][file]") {
    TempPath path("stderrx_saved.json");

    Config config;
    config.debug = true;
    config.color = ColorMode::Never;
    config.width = 72;
    config.label = "svc";
    config.glyphs.set(Level::Warn, "!");

    REQUIRE(save_config(config, path.str()));

    auto loaded = load_config(path.str());
    REQUIRE(loaded.has_value());
    CHECK(loaded->debug);
    CHECK_FALSE(loaded->quiet);
    CHECK(loaded->color == ColorMode::Never);
    CHECK(loaded->width == 72);
    CHECK(loaded->label == std::optional<std::string>("svc"));
    CHECK(loaded->glyphs.glyph_for(Level::Warn) == "!");
    CHECK(loaded->glyphs == config.glyphs);
}

TEST_CASE("Partial config files keep defaults", "[config][file]") {
    TempPath path("stderrx_partial.json");
    {
        std::ofstream file(path.str());
        file << R"({"trace": true, "glyphs": {"info": "i", "note": "ignored"}})";
    }

    auto loaded = load_config(path.str());
    REQUIRE(loaded.has_value());
    CHECK(loaded->trace);
    CHECK(loaded->color == ColorMode::Auto);
    CHECK(loaded->width == 0);
    CHECK_FALSE(loaded->label.has_value());
    CHECK(loaded->glyphs.info == "i");
    CHECK(loaded->glyphs.warn == "△");
}

TEST_CASE("Malformed config file loads nothing", "[config][file]") {
    TempPath path("stderrx_broken.json");
    {
        std::ofstream file(path.str());
        file << "{ not json";
    }

    REQUIRE_FALSE(load_config(path.str()).has_value());
}
