#pragma once

#include "logger.hpp"

namespace stderrx {

/**
 * Process-wide logger, created on first use from the *_MODE environment
 * variables and writing to stderr.
 *
 * Initialization is thread-safe; use afterwards is not. Callers on several
 * threads must serialize access themselves.
 */
Logger& global_logger();

} // namespace stderrx
