#include "logger.hpp"
#include "diag.hpp"
#include "style.hpp"
#include "terminal.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>

namespace stderrx {

namespace {

// Resolves ColorMode::Auto the way a terminal program would: colors only on
// a TTY whose TERM is set and not "dumb".
bool detect_colors(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always:
            return true;
        case ColorMode::Never:
            return false;
        case ColorMode::Auto:
            break;
    }

    const char* term = std::getenv("TERM");
    if (!term || std::string(term) == "dumb") {
        return false;
    }
    return terminal::is_tty();
}

} // namespace

Logger::Logger() : Logger(Config()) {}

Logger::Logger(Config config) : Logger(std::move(config), stderr_sink()) {}

Logger::Logger(Config config, Sink sink)
    : config_(std::move(config))
    , sink_(std::move(sink))
    , colors_enabled_(detect_colors(config_.color))
{
}

int Logger::width() const {
    return config_.width > 0 ? config_.width : terminal::get_width();
}

bool Logger::enabled(Level level) const {
    switch (level) {
        case Level::Error:
        case Level::Okay:
            return true;
        case Level::Info:
        case Level::Note:
        case Level::Warn:
            return !config_.quiet;
        case Level::Debug:
            return !config_.quiet && config_.debug;
        case Level::Trace:
            return !config_.quiet && config_.trace;
        case Level::Magic:
        case Level::Silly:
            return !config_.quiet && config_.silly;
        case Level::DevLog:
            return !config_.quiet && config_.dev;
    }
    return false;
}

// ========== Output Primitives ==========

Status Logger::write(const std::string& text) {
    if (!sink_) {
        return Status::failure(ErrorKind::Io, "no output sink");
    }

    bool written = false;
    try {
        written = sink_(text);
    } catch (const std::exception& e) {
        return Status::failure(ErrorKind::Io, std::string("output sink failed: ") + e.what());
    }

    if (!written) {
        return Status::failure(ErrorKind::Io, "failed to write to output sink");
    }
    return Status::ok();
}

std::string Logger::paint(const std::string& text, int color, bool bold) const {
    if (!colors_enabled_) {
        return text;
    }
    return (bold ? std::string(ansi::BOLD) : std::string()) + ansi::fg(color) + text + ansi::RESET;
}

std::string Logger::format_message(Level level, const std::string& msg) const {
    std::string glyph = config_.glyphs.glyph_for(level);
    std::string prefix = config_.label
        ? "[" + *config_.label + "][" + glyph + "]"
        : "[" + glyph + "]";
    return paint(prefix + " " + msg, level_color(level)) + "\n";
}

Status Logger::write_lines(const Lines& lines, std::optional<int> color) {
    if (lines.empty()) {
        return Status::ok();
    }
    if (!color) {
        return write(grid::join(lines));
    }

    std::string out;
    for (const auto& line : lines) {
        out += paint(line, *color) + "\n";
    }
    return write(out);
}

Status Logger::log(Level level, const std::string& msg) {
    if (!enabled(level)) {
        return Status::ok();
    }
    return write(format_message(level, msg));
}

Status Logger::print(const std::string& text) {
    if (config_.quiet) {
        return Status::ok();
    }
    return write(text + "\n");
}

// ========== Context ==========

Status Logger::set_context(const std::string& context) {
    Status status;
    if (context_.needs_banner(context) && !config_.quiet) {
        status = write(paint(grid::context_banner(context, width()), palette::BLUE) + "\n");
        if (status.is_ok()) {
            context_.mark_shown(context);
        }
    }
    context_.set_current(context);
    return status;
}

// ========== Tracing ==========

TraceScope Logger::enter(const std::string& name, const std::string& text) {
    const TraceFrame& frame = trace_.push(name);
    Status status = trace_line(TraceStack::header_line(frame.depth, name, text));
    return TraceScope(this, frame.id, name, std::move(status));
}

Status Logger::trace_line(const std::string& line) {
    if (!enabled(Level::Trace)) {
        return Status::ok();
    }
    return write(paint(line, level_color(Level::Trace)) + "\n");
}

Status Logger::trace_step(std::uint64_t id, const std::string& text) {
    const TraceFrame* frame = trace_.find(id);
    if (!frame) {
        return Status::failure(ErrorKind::HandleMisuse, "trace frame is no longer open");
    }
    if (!trace_.is_top(id)) {
        return Status::failure(ErrorKind::HandleMisuse,
            "trace frame '" + frame->name + "' is not the innermost open frame");
    }
    return trace_line(TraceStack::step_line(frame->depth, text));
}

Status Logger::trace_exit(std::uint64_t id, const std::string& text) {
    const TraceFrame* frame = trace_.find(id);
    if (!frame) {
        return Status::failure(ErrorKind::HandleMisuse, "trace frame is no longer open");
    }
    if (!trace_.is_top(id)) {
        return Status::failure(ErrorKind::HandleMisuse,
            "trace frame '" + frame->name + "' is not the innermost open frame");
    }

    std::string line = TraceStack::exit_line(frame->depth, text);
    trace_.remove(id);
    return trace_line(line);
}

void Logger::trace_release(std::uint64_t id) {
    const TraceFrame* frame = trace_.find(id);
    if (!frame) {
        return;
    }

    std::string name = frame->name;
    std::string line = TraceStack::exit_line(frame->depth, TRACE_EXIT_TEXT);
    if (!trace_.is_top(id)) {
        diag_err("trace", "frame '" + name + "' released while inner frames are open");
    }
    trace_.remove(id);

    Status status = trace_line(line);
    if (!status) {
        diag_err("trace", "exit of '" + name + "': " + status.to_string());
    }
}

Status Logger::trace_labelled(const std::string& label, int color, const std::string& msg) {
    if (!enabled(Level::Trace)) {
        return Status::ok();
    }
    return write(paint(TraceStack::label_line(trace_.depth(), label, msg), color) + "\n");
}

Status Logger::trace_add(const std::string& msg) {
    return trace_labelled("+", palette::GREEN, msg);
}

Status Logger::trace_sub(const std::string& msg) {
    return trace_labelled("-", palette::RED, msg);
}

Status Logger::trace_found(const std::string& msg) {
    return trace_labelled("✻", palette::BLUE, msg);
}

Status Logger::trace_done(const std::string& msg) {
    return trace_labelled("✔", palette::GREEN, msg);
}

Status Logger::trace_item(const std::string& msg) {
    return trace_labelled("⟐", palette::PURPLE, msg);
}

// ========== Formatting ==========

Status Logger::banner(const std::string& msg, const std::string& fill) {
    if (config_.quiet) {
        return Status::ok();
    }

    std::string open;
    std::string close;
    if (colors_enabled_) {
        open = std::string(ansi::BOLD) + ansi::fg(palette::BLUE);
        close = ansi::RESET;
    }
    return write(grid::banner(msg, fill, width(), open, close) + "\n");
}

Status Logger::boxed(const std::string& text, BorderStyle style) {
    if (config_.quiet) {
        return Status::ok();
    }
    return write_lines(grid::box(text, style), palette::WHITE);
}

Status Logger::simple_table(const Grid& rows) {
    if (config_.quiet) {
        return Status::ok();
    }

    Lines lines = grid::simple_table(rows);
    if (lines.empty()) {
        return Status::ok();
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i == 0) {
            out += paint(lines[i], palette::BLUE, true);
        } else if (i == 1) {
            out += paint(lines[i], palette::GREY);
        } else {
            out += lines[i];
        }
        out += "\n";
    }
    return write(out);
}

Status Logger::columns(const std::vector<std::string>& items, size_t num_cols) {
    if (config_.quiet) {
        return Status::ok();
    }

    Result<Lines> lines = grid::columns(items, num_cols);
    if (!lines) {
        return lines.status();
    }
    return write_lines(lines.value());
}

Status Logger::bullet_list(const std::vector<std::string>& items, const std::string& bullet) {
    if (config_.quiet) {
        return Status::ok();
    }
    return write_lines(grid::bullet_list(items, bullet));
}

Status Logger::numbered_list(const std::vector<std::string>& items) {
    if (config_.quiet) {
        return Status::ok();
    }
    return write_lines(grid::numbered_list(items));
}

Status Logger::flag_table(const FlagSpec& spec, BorderStyle style) {
    if (config_.quiet) {
        return Status::ok();
    }

    Result<Lines> lines = grid::flag_table(spec, style);
    if (!lines) {
        return lines.status();
    }
    return write_lines(lines.value());
}

Status Logger::color_grid(int cols) {
    if (config_.quiet) {
        return Status::ok();
    }

    Result<Lines> lines = grid::color_grid(cols, colors_enabled_);
    if (!lines) {
        return lines.status();
    }
    return write_lines(lines.value());
}

Status Logger::glyph_catalog(size_t num_cols) {
    if (config_.quiet) {
        return Status::ok();
    }

    std::vector<std::string> items;
    for (const auto& g : stderrx::glyph_catalog()) {
        char code[16];
        std::snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(g.codepoint));
        items.push_back(std::string(g.glyph) + " " + terminal::pad_right(g.name, 15) + " " + code);
    }

    Result<Lines> lines = grid::columns(items, num_cols);
    if (!lines) {
        return lines.status();
    }
    return write_lines(lines.value());
}

// ========== Interactive ==========

Result<std::optional<bool>> Logger::confirm(const std::string& prompt) {
    return confirm_builder(prompt).ask();
}

} // namespace stderrx
