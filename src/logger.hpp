#pragma once

#include "boxes.hpp"
#include "config.hpp"
#include "confirm.hpp"
#include "context.hpp"
#include "describe.hpp"
#include "glyphs.hpp"
#include "grid.hpp"
#include "sink.hpp"
#include "status.hpp"
#include "trace.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stderrx {

/**
 * Terminal logger with semantic levels, context banners, hierarchical
 * tracing and grid formatting.
 *
 * Every public call first checks the verbosity gate, then renders its output
 * and hands it to the sink in a single write. A failed write comes back as an
 * Io status; nothing here exits the process.
 *
 * A Logger is not synchronized. Code that shares one between threads must
 * serialize access to it.
 */
class Logger {
public:
    // Default verbosity, writes to stderr.
    Logger();

    explicit Logger(Config config);

    Logger(Config config, Sink sink);

    // Trace handles point back at their logger, so it never moves.
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // ========== Configuration ==========

    const Config& config() const { return config_; }

    void set_quiet(bool quiet) { config_.quiet = quiet; }
    void set_debug(bool debug) { config_.debug = debug; }
    void set_trace(bool trace) { config_.trace = trace; }
    void set_silly(bool silly) { config_.silly = silly; }
    void set_dev(bool dev) { config_.dev = dev; }

    bool colors_enabled() const { return colors_enabled_; }
    void set_colors(bool enabled) { colors_enabled_ = enabled; }

    // Banner width: the configured width, or the terminal width.
    int width() const;

    void set_label(const std::string& label) { config_.label = label; }
    void clear_label() { config_.label.reset(); }
    const std::optional<std::string>& label() const { return config_.label; }

    void set_glyphs(const GlyphSet& glyphs) { config_.glyphs = glyphs; }
    bool set_glyph(Level level, const std::string& glyph) { return config_.glyphs.set(level, glyph); }

    void set_sink(Sink sink) { sink_ = std::move(sink); }

    // True if a message at this level passes the verbosity gate.
    bool enabled(Level level) const;

    // ========== Levels ==========

    Status log(Level level, const std::string& msg);

    Status okay(const std::string& msg) { return log(Level::Okay, msg); }
    Status info(const std::string& msg) { return log(Level::Info, msg); }
    Status note(const std::string& msg) { return log(Level::Note, msg); }
    Status warn(const std::string& msg) { return log(Level::Warn, msg); }
    Status error(const std::string& msg) { return log(Level::Error, msg); }
    Status debug(const std::string& msg) { return log(Level::Debug, msg); }
    Status trace(const std::string& msg) { return log(Level::Trace, msg); }
    Status magic(const std::string& msg) { return log(Level::Magic, msg); }
    Status silly(const std::string& msg) { return log(Level::Silly, msg); }
    Status devlog(const std::string& msg) { return log(Level::DevLog, msg); }

    // Pretty-prints any describable value (see describe.hpp) at a level.
    template <typename T>
    Status inspect(Level level, const T& value) {
        if (!enabled(level)) {
            return Status::ok();
        }
        return write(format_message(level, describe(value)));
    }

    // ========== Context ==========

    /**
     * Declares the current context. A banner is shown when the context
     * differs from the last one shown.
     */
    Status set_context(const std::string& context);

    // Clears the current context without output.
    void clear_context() { context_.clear(); }

    /**
     * Runs body under the given context, then restores the previous context
     * state exactly, also when body throws. Returns the status of the banner.
     */
    template <typename Fn>
    Status with_context(const std::string& context, Fn&& body) {
        ContextGuard guard(context_);
        Status status = set_context(context);
        std::forward<Fn>(body)();
        return status;
    }

    const std::optional<std::string>& context() const { return context_.current(); }
    const ContextState& context_state() const { return context_.state(); }

    // ========== Tracing ==========

    // Opens a trace frame and writes its header line.
    TraceScope enter(const std::string& name, const std::string& text = TRACE_ENTER_TEXT);

    /**
     * Runs body(TraceScope&) inside a new frame. The exit line is written
     * however body leaves. Returns what body returns.
     */
    template <typename Fn>
    decltype(auto) scope(const std::string& name, Fn&& body) {
        TraceScope handle = enter(name);
        return std::forward<Fn>(body)(handle);
    }

    // Number of open trace frames.
    size_t trace_depth() const { return trace_.depth(); }

    // Labelled trace lines at the current depth.
    Status trace_add(const std::string& msg);
    Status trace_sub(const std::string& msg);
    Status trace_found(const std::string& msg);
    Status trace_done(const std::string& msg);
    Status trace_item(const std::string& msg);

    // ========== Formatting ==========

    // Centers msg in a line of fill characters.
    Status banner(const std::string& msg, const std::string& fill = "=");

    // Draws text in a box with the given border style.
    Status boxed(const std::string& text, BorderStyle style = BorderStyle::Light);
    Status box_light(const std::string& text) { return boxed(text, BorderStyle::Light); }
    Status box_heavy(const std::string& text) { return boxed(text, BorderStyle::Heavy); }
    Status box_double(const std::string& text) { return boxed(text, BorderStyle::Double); }

    // Help text in a light box.
    Status help(const std::string& text) { return boxed(text, BorderStyle::Light); }

    // First row is the header.
    Status simple_table(const Grid& rows);

    /**
     * Table of headers plus one row per item. Row is any type with a
     * columns() member returning std::vector<std::string>.
     */
    template <typename Row>
    Status table(const std::vector<std::string>& headers, const std::vector<Row>& rows) {
        Grid grid;
        grid.push_back(headers);
        for (const auto& row : rows) {
            grid.push_back(row.columns());
        }
        return simple_table(grid);
    }

    Status columns(const std::vector<std::string>& items, size_t num_cols);
    Status bullet_list(const std::vector<std::string>& items, const std::string& bullet = "•");
    Status numbered_list(const std::vector<std::string>& items);
    Status flag_table(const FlagSpec& spec, BorderStyle style = BorderStyle::Light);

    // 256-color swatch grid.
    Status color_grid(int cols);

    // Every catalog glyph with its name and code point, in columns.
    Status glyph_catalog(size_t num_cols = 3);

    // ========== Interactive ==========

    ConfirmBuilder confirm_builder(const std::string& prompt) { return ConfirmBuilder(*this, prompt); }

    // Plain y/n/q confirmation read from std::cin.
    Result<std::optional<bool>> confirm(const std::string& prompt);

    // ========== Raw Output ==========

    // Writes text and a newline, unless quiet.
    Status print(const std::string& text);

    // Writes an empty line, unless quiet.
    Status newline() { return print(""); }

private:
    friend class TraceScope;
    friend class ConfirmBuilder;

    Config config_;
    Sink sink_;
    bool colors_enabled_;
    ContextController context_;
    TraceStack trace_;

    // Single sink write. A false return or an exception from the sink
    // becomes an Io status.
    Status write(const std::string& text);

    // Wraps text in a palette color when colors are enabled.
    std::string paint(const std::string& text, int color, bool bold = false) const;

    // "[label][glyph] msg\n", colored for the level.
    std::string format_message(Level level, const std::string& msg) const;

    // Writes rendered lines, optionally painting each one.
    Status write_lines(const Lines& lines, std::optional<int> color = std::nullopt);

    Status trace_line(const std::string& line);
    Status trace_labelled(const std::string& label, int color, const std::string& msg);

    // Called by TraceScope.
    Status trace_step(std::uint64_t id, const std::string& text);
    Status trace_exit(std::uint64_t id, const std::string& text);
    void trace_release(std::uint64_t id);
};

} // namespace stderrx
