#include "context.hpp"

namespace stderrx {

bool ContextController::needs_banner(const std::string& context) const {
    return !state_.last_shown || *state_.last_shown != context;
}

void ContextController::mark_shown(const std::string& context) {
    state_.last_shown = context;
}

void ContextController::set_current(const std::string& context) {
    state_.current = context;
}

void ContextController::clear() {
    state_.current.reset();
}

void ContextController::restore(const ContextState& state) {
    state_ = state;
}

ContextGuard::ContextGuard(ContextController& controller)
    : controller_(controller)
    , saved_(controller.state())
{
}

ContextGuard::~ContextGuard() {
    controller_.restore(saved_);
}

} // namespace stderrx
