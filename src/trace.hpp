#pragma once

/**
 * Hierarchical call tracing.
 *
 * A TraceStack holds the currently open frames. Each frame is owned by
 * exactly one TraceScope handle, obtained from Logger::enter() and released
 * either explicitly with exit() or by its destructor, so the exit line is
 * written on every path out of the scope (normal return, early return or
 * exception).
 *
 * Output for nested frames:
 *
 *   λ load_config: entering
 *   ├┄ reading file
 *   ┆   λ parse: entering
 *   ┆   ├┄ 3 sections
 *   ┆   └┄ exiting
 *   └┄ exiting
 */

#include "describe.hpp"
#include "status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stderrx {

class Logger;

constexpr const char* TRACE_HEADER_GLYPH = "λ";
constexpr const char* TRACE_CONTINUATION = "┆   ";  // One per open ancestor frame.
constexpr const char* TRACE_BRANCH = "├┄ ";         // Intermediate step.
constexpr const char* TRACE_LAST_BRANCH = "└┄ ";    // Exit line.
constexpr const char* TRACE_ENTER_TEXT = "entering";
constexpr const char* TRACE_EXIT_TEXT = "exiting";

struct TraceFrame {
    std::uint64_t id;
    std::string name;
    size_t depth;  // 1 for the outermost frame.
};

/**
 * Ordered stack of open trace frames plus the line layout rules.
 */
class TraceStack {
public:
    // Opens a frame one level deeper than the current top.
    const TraceFrame& push(const std::string& name);

    // Removes a frame wherever it is and renumbers the frames above it.
    // Returns false if no frame has this id.
    bool remove(std::uint64_t id);

    const TraceFrame* find(std::uint64_t id) const;
    bool is_top(std::uint64_t id) const;

    size_t depth() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    const std::vector<TraceFrame>& frames() const { return frames_; }

    // ========== Line Layout ==========

    // Continuation glyphs for the ancestors of a frame at this depth.
    static std::string indent(size_t depth);

    static std::string header_line(size_t depth, const std::string& name, const std::string& text);
    static std::string step_line(size_t depth, const std::string& text);
    static std::string exit_line(size_t depth, const std::string& text);

    // "└┄┄[ <label> ] <text>" at the given depth.
    static std::string label_line(size_t depth, const std::string& label, const std::string& text);

private:
    std::vector<TraceFrame> frames_;
    std::uint64_t next_id_ = 1;
};

/**
 * Handle for one open trace frame.
 *
 * Only the handle of the innermost open frame may step or exit; anything
 * else returns a HandleMisuse status without writing. A handle must not
 * outlive the Logger that created it.
 */
class TraceScope {
public:
    TraceScope(TraceScope&& other) noexcept;
    TraceScope& operator=(TraceScope&&) = delete;
    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

    // Releases the frame if exit() was not called.
    ~TraceScope();

    // Writes an intermediate step line.
    Status step(const std::string& text);

    // Writes "text: <value>" as a step.
    template <typename T>
    Status step_value(const std::string& text, const T& value) {
        return step(text + ": " + describe(value));
    }

    // Writes the exit line and closes the frame. Fails on a second call.
    Status exit(const std::string& text = TRACE_EXIT_TEXT);

    // True until the frame has been closed.
    bool active() const { return logger_ != nullptr; }

    bool is_top() const;

    // Depth of the frame, or 0 once released.
    size_t depth() const;

    const std::string& name() const { return name_; }

    // Outcome of writing the header line.
    const Status& entry_status() const { return entry_status_; }

private:
    friend class Logger;

    TraceScope(Logger* logger, std::uint64_t id, std::string name, Status entry_status);

    Logger* logger_;
    std::uint64_t id_;
    std::string name_;
    Status entry_status_;
};

} // namespace stderrx
