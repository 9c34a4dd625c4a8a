#include "boxes.hpp"
#include "config.hpp"
#include "diag.hpp"
#include "logger.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace stderrx;

// ========== Demo Data ==========

// One row of the "table" demo.
struct Service {
    std::string name;
    std::string state;
    int port;

    std::vector<std::string> columns() const {
        return {name, state, std::to_string(port)};
    }
};

// Reports a failed status on stderr. Returns the process exit code.
int report(const Status& status) {
    if (status) {
        return 0;
    }
    std::cerr << "stderrx-demo: " << status.to_string() << std::endl;
    return 1;
}

// ========== Demos ==========

int demo_levels(Logger& log) {
    Status status = log.okay("build finished");
    if (status) status = log.info("reading 3 inputs");
    if (status) status = log.note("cache is cold");
    if (status) status = log.warn("config key 'colour' is deprecated");
    if (status) status = log.error("could not open 'missing.txt'");
    if (status) status = log.debug("resolved 12 symbols");
    if (status) status = log.trace("visiting node 7");
    if (status) status = log.magic("all tests green on the first try");
    if (status) status = log.silly("counting sheep: 42");
    if (status) status = log.devlog("allocator high-water mark: 4 MiB");
    if (status) {
        nlohmann::json value = {{"name", "stderrx"}, {"levels", 10}, {"colors", true}};
        status = log.inspect(Level::Debug, value);
    }
    return report(status);
}

int demo_context(Logger& log) {
    Status status = log.set_context("setup");
    if (status) status = log.info("first message under setup");
    if (status) status = log.info("second message, no new banner");

    if (status) {
        status = log.with_context("build", [&]() {
            Status inner = log.info("compiling");
            if (inner) {
                inner = log.with_context("link", [&]() {
                    Status linked = log.info("linking");
                    if (!linked) {
                        diag_err("demo", linked.to_string());
                    }
                });
            }
            if (!inner) {
                diag_err("demo", inner.to_string());
            }
        });
    }
    if (status) status = log.info("back under setup, no banner");
    return report(status);
}

// Recursive walk that traces every call.
Status walk(Logger& log, int depth, int max_depth) {
    return log.scope("walk(" + std::to_string(depth) + ")", [&](TraceScope& t) {
        Status status = t.step_value("depth", depth);
        if (!status) {
            return status;
        }
        if (depth < max_depth) {
            status = walk(log, depth + 1, max_depth);
            if (!status) {
                return status;
            }
        }
        return t.exit("done at " + std::to_string(depth));
    });
}

int demo_trace(Logger& log, int depth) {
    // Frames are only drawn with tracing on.
    log.set_trace(true);

    Status status = walk(log, 1, depth);
    if (status) status = log.trace_add("inserted key 'alpha'");
    if (status) status = log.trace_sub("removed key 'beta'");
    if (status) status = log.trace_found("match at offset 17");
    if (status) status = log.trace_item("queued item 3");
    if (status) status = log.trace_done("walk complete");
    return report(status);
}

int demo_table(Logger& log) {
    std::vector<Service> services = {
        {"api", "running", 8080},
        {"worker", "stopped", 0},
        {"db", "running", 5432},
    };

    Status status = log.table({"Service", "State", "Port"}, services);
    if (status) status = log.newline();
    if (status) status = log.simple_table({{"名前", "Size"}, {"データ", "12"}, {"log.txt"}});
    if (status) status = log.newline();
    if (status) status = log.columns({"alpha", "beta", "gamma", "delta", "epsilon", "zeta", "eta"}, 3);
    if (status) status = log.newline();
    if (status) status = log.bullet_list({"first", "second"});
    if (status) status = log.numbered_list({"clone", "configure", "build"});
    return report(status);
}

int demo_box(Logger& log, const std::string& text, const std::string& style_name) {
    BorderStyle style;
    if (!parse_border_style(style_name, style)) {
        std::cerr << "stderrx-demo: unknown border style '" << style_name << "'" << std::endl;
        return 1;
    }
    return report(log.boxed(text, style));
}

int demo_flags(Logger& log, uint64_t value, unsigned bits) {
    FlagSpec spec;
    spec.bit_width = bits;
    spec.value = value;
    const std::vector<std::string> names = {"RD", "WR", "EX", "HD", "SY", "AR", "LK", "TM"};
    for (unsigned i = 0; i < bits && i < names.size(); i++) {
        spec.labels.push_back(names[i]);
    }
    return report(log.flag_table(spec));
}

int demo_confirm(Logger& log, const std::string& prompt, bool boxed) {
    Result<std::optional<bool>> answer = log.confirm_builder(prompt).boxed(boxed).ask();
    if (!answer) {
        return report(answer.status());
    }

    Status status;
    if (!answer.value()) {
        status = log.note("quit");
    } else if (*answer.value()) {
        status = log.okay("confirmed");
    } else {
        status = log.warn("declined");
    }
    return report(status);
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Demonstrates stderrx terminal logging, tracing and layout"};
    app.footer("\nExamples:\n"
               "  stderrx-demo levels --debug --silly   Show every message level\n"
               "  stderrx-demo trace --depth 4          Nested trace frames\n"
               "  stderrx-demo flags --value 0xA5        Bit flag table\n"
               "  stderrx-demo box 'hello' --style heavy\n");
    app.require_subcommand(1);

    bool quiet = false;
    bool debug = false;
    bool trace = false;
    bool silly = false;
    bool dev = false;
    app.add_flag("-q,--quiet", quiet, "Only show errors and okay messages");
    app.add_flag("-d,--debug", debug, "Show debug messages");
    app.add_flag("-t,--trace", trace, "Show trace messages and frames");
    app.add_flag("--silly", silly, "Show silly and magic messages");
    app.add_flag("--dev", dev, "Show devlog messages");

    std::string config_path;
    app.add_option("-c,--config", config_path, "Read settings from a JSON file");

    bool no_color = false;
    app.add_flag("--no-color", no_color, "Disable ANSI colors");

    int width = 0;
    app.add_option("-w,--width", width, "Banner width (default: terminal width)")
        ->check(CLI::Range(0, 1000));

    bool diagnostics = false;
    app.add_flag("--diag", diagnostics, "Print internal diagnostics");

    auto* levels_cmd = app.add_subcommand("levels", "Print one message at every level");
    auto* context_cmd = app.add_subcommand("context", "Context banners and nesting");

    auto* trace_cmd = app.add_subcommand("trace", "Nested trace frames");
    int trace_depth = 3;
    trace_cmd->add_option("--depth", trace_depth, "Recursion depth")->check(CLI::Range(1, 16));

    auto* table_cmd = app.add_subcommand("table", "Tables, columns and lists");

    auto* box_cmd = app.add_subcommand("box", "Draw text in a box");
    std::string box_text = "stderrx\nboxes handle wide text: 日本語";
    std::string box_style = "light";
    box_cmd->add_option("text", box_text, "Text to draw");
    box_cmd->add_option("-s,--style", box_style, "light, heavy, double or none");

    auto* flags_cmd = app.add_subcommand("flags", "Bit flag table");
    uint64_t flag_value = 0xA5;
    unsigned flag_bits = 8;
    flags_cmd->add_option("--value", flag_value, "Value to show");
    flags_cmd->add_option("--bits", flag_bits, "Bit width")->check(CLI::Range(1, 64));

    auto* grid_cmd = app.add_subcommand("grid", "256-color swatch grid");
    int grid_cols = 16;
    grid_cmd->add_option("--cols", grid_cols, "Swatches per row")->check(CLI::Range(1, 64));

    auto* glyphs_cmd = app.add_subcommand("glyphs", "Glyph catalog");
    size_t glyph_cols = 3;
    glyphs_cmd->add_option("--cols", glyph_cols, "Columns")->check(CLI::Range(1, 8));

    auto* confirm_cmd = app.add_subcommand("confirm", "Ask a y/n/q question");
    std::string confirm_prompt = "Continue?";
    bool confirm_boxed = false;
    confirm_cmd->add_option("prompt", confirm_prompt, "Question to ask");
    confirm_cmd->add_flag("--boxed", confirm_boxed, "Draw the question in a box");

    auto* help_cmd = app.add_subcommand("help", "Show usage in a box");

    CLI11_PARSE(app, argc, argv);

    if (diagnostics) {
        set_diagnostics(true);
    }

    Config config = Config::from_env();
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded) {
            std::cerr << "stderrx-demo: could not read config '" << config_path << "'" << std::endl;
            return 1;
        }
        config = *loaded;
    }

    // Command line flags only ever turn things on.
    config.quiet = config.quiet || quiet;
    config.debug = config.debug || debug;
    config.trace = config.trace || trace;
    config.silly = config.silly || silly;
    config.dev = config.dev || dev;
    if (no_color) {
        config.color = ColorMode::Never;
    }
    if (width > 0) {
        config.width = width;
    }

    Logger log(config);

    if (*levels_cmd) {
        return demo_levels(log);
    }
    if (*context_cmd) {
        return demo_context(log);
    }
    if (*trace_cmd) {
        return demo_trace(log, trace_depth);
    }
    if (*table_cmd) {
        return demo_table(log);
    }
    if (*box_cmd) {
        return demo_box(log, box_text, box_style);
    }
    if (*flags_cmd) {
        return demo_flags(log, flag_value, flag_bits);
    }
    if (*grid_cmd) {
        return report(log.color_grid(grid_cols));
    }
    if (*glyphs_cmd) {
        return report(log.glyph_catalog(glyph_cols));
    }
    if (*confirm_cmd) {
        return demo_confirm(log, confirm_prompt, confirm_boxed);
    }
    if (*help_cmd) {
        return report(log.help(app.help()));
    }
    return 0;
}
