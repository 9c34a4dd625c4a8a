#pragma once

/**
 * Logger configuration.
 *
 * Verbosity flags gate which calls produce output; the remaining fields
 * control presentation. A Config can come from defaults, the process
 * environment or a JSON file.
 */

#include "glyphs.hpp"

#include <optional>
#include <string>

namespace stderrx {

// ========== File Paths ==========

constexpr const char* CONFIG_FILE = ".stderrx.json";  // Default config file.

// ========== Environment Variables ==========

constexpr const char* ENV_QUIET = "QUIET_MODE";
constexpr const char* ENV_DEBUG = "DEBUG_MODE";
constexpr const char* ENV_TRACE = "TRACE_MODE";
constexpr const char* ENV_SILLY = "SILLY_MODE";
constexpr const char* ENV_DEV = "DEV_MODE";

// When to emit ANSI color codes.
enum class ColorMode {
    Auto,    // Only when stderr is a TTY and TERM is not "dumb".
    Always,
    Never
};

/**
 * Resolved verbosity flags and presentation options.
 */
struct Config {
    bool quiet = false;  // Suppresses everything but error and okay.
    bool debug = false;  // Enables debug messages.
    bool trace = false;  // Enables trace messages and trace frames.
    bool silly = false;  // Enables silly and magic messages.
    bool dev = false;    // Enables devlog messages.

    ColorMode color = ColorMode::Auto;
    int width = 0;                     // Banner width; 0 = terminal width.
    std::optional<std::string> label;  // Prefix label, e.g. "[app][λ] msg".
    GlyphSet glyphs;

    // Reads the *_MODE environment variables. A flag is on when its variable is set.
    static Config from_env();
};

// Parses "auto", "always" or "never". Returns false if unknown.
bool parse_color_mode(const std::string& name, ColorMode& out);

// Loads a config from a JSON file. Returns empty optional if the file doesn't
// exist or can't be parsed.
std::optional<Config> load_config(const std::string& path = CONFIG_FILE);

// Saves a config as JSON. Returns false if the file can't be written.
bool save_config(const Config& config, const std::string& path = CONFIG_FILE);

} // namespace stderrx
