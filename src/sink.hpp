#pragma once

#include <functional>
#include <ostream>
#include <string>

namespace stderrx {

/**
 * Output sink. Receives a chunk of rendered text and returns true if it was
 * written. Any callable with this shape can stand in for the terminal.
 *
 * Usage:
 *   std::string captured;
 *   Logger log(config, [&](const std::string& s) { captured += s; return true; });
 */
using Sink = std::function<bool(const std::string&)>;

// Writes to std::cerr and flushes. The default sink.
Sink stderr_sink();

// Writes to the given stream, which must outlive the sink.
Sink stream_sink(std::ostream& out);

} // namespace stderrx
