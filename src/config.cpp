#include "config.hpp"
#include "diag.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

namespace stderrx {

using json = nlohmann::json;

namespace {

bool env_set(const char* name) {
    return std::getenv(name) != nullptr;
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::Auto: return "auto";
        case ColorMode::Always: return "always";
        case ColorMode::Never: return "never";
    }
    return "auto";
}

// JSON keys for the configurable glyphs.
const std::pair<const char*, Level> GLYPH_KEYS[] = {
    {"info", Level::Info},
    {"warn", Level::Warn},
    {"error", Level::Error},
    {"okay", Level::Okay},
    {"trace", Level::Trace},
    {"debug", Level::Debug},
    {"magic", Level::Magic},
};

} // namespace

Config Config::from_env() {
    Config config;
    config.quiet = env_set(ENV_QUIET);
    config.debug = env_set(ENV_DEBUG);
    config.trace = env_set(ENV_TRACE);
    config.silly = env_set(ENV_SILLY);
    config.dev = env_set(ENV_DEV);
    return config;
}

bool parse_color_mode(const std::string& name, ColorMode& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto") {
        out = ColorMode::Auto;
    } else if (lower == "always") {
        out = ColorMode::Always;
    } else if (lower == "never") {
        out = ColorMode::Never;
    } else {
        return false;
    }
    return true;
}

std::optional<Config> load_config(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        diag_err("config", "cannot open " + path);
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Config config;
        config.quiet = j.value("quiet", false);
        config.debug = j.value("debug", false);
        config.trace = j.value("trace", false);
        config.silly = j.value("silly", false);
        config.dev = j.value("dev", false);
        config.width = j.value("width", 0);

        std::string color = j.value("color", "auto");
        if (!parse_color_mode(color, config.color)) {
            diag_err("config", "unknown color mode '" + color + "' in " + path);
        }

        if (j.contains("label") && j["label"].is_string()) {
            config.label = j["label"].get<std::string>();
        }

        if (j.contains("glyphs") && j["glyphs"].is_object()) {
            const json& glyphs = j["glyphs"];
            for (const auto& [key, level] : GLYPH_KEYS) {
                if (glyphs.contains(key) && glyphs[key].is_string()) {
                    config.glyphs.set(level, glyphs[key].get<std::string>());
                }
            }
        }

        diag_log("config", "loaded " + path);
        return config;
    } catch (const json::exception& e) {
        diag_err("config", path + ": " + e.what());
        return std::nullopt;
    }
}

bool save_config(const Config& config, const std::string& path) {
    json j;
    j["quiet"] = config.quiet;
    j["debug"] = config.debug;
    j["trace"] = config.trace;
    j["silly"] = config.silly;
    j["dev"] = config.dev;
    j["color"] = color_mode_name(config.color);
    j["width"] = config.width;
    if (config.label) {
        j["label"] = *config.label;
    }

    json glyphs = json::object();
    for (const auto& [key, level] : GLYPH_KEYS) {
        glyphs[key] = config.glyphs.glyph_for(level);
    }
    j["glyphs"] = glyphs;

    std::ofstream file(path);
    if (!file.is_open()) {
        diag_err("config", "cannot write " + path);
        return false;
    }
    file << j.dump(2) << std::endl;
    return static_cast<bool>(file);
}

} // namespace stderrx
