#pragma once

/**
 * Tracks the caller's declared context and decides when a context banner
 * must be shown.
 *
 * A banner is due whenever the requested context differs from the last one
 * actually shown. last_shown is only updated when a banner was emitted, and
 * clear() leaves it alone, so re-setting the same context after a clear does
 * not repeat the banner.
 */

#include <optional>
#include <string>

namespace stderrx {

struct ContextState {
    std::optional<std::string> current;
    std::optional<std::string> last_shown;

    bool operator==(const ContextState& other) const {
        return current == other.current && last_shown == other.last_shown;
    }
    bool operator!=(const ContextState& other) const { return !(*this == other); }
};

class ContextController {
public:
    // True if setting this context must render a banner first.
    bool needs_banner(const std::string& context) const;

    // Records that a banner for this context was emitted.
    void mark_shown(const std::string& context);

    void set_current(const std::string& context);

    // Drops the current context. last_shown is untouched.
    void clear();

    const std::optional<std::string>& current() const { return state_.current; }
    const ContextState& state() const { return state_; }

    // Replaces the whole state verbatim.
    void restore(const ContextState& state);

private:
    ContextState state_;
};

/**
 * Snapshots a controller's state and restores it on destruction, including
 * when the guarded code exits by exception.
 */
class ContextGuard {
public:
    explicit ContextGuard(ContextController& controller);
    ~ContextGuard();

    ContextGuard(const ContextGuard&) = delete;
    ContextGuard& operator=(const ContextGuard&) = delete;

private:
    ContextController& controller_;
    ContextState saved_;
};

} // namespace stderrx
