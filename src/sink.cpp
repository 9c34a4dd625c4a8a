#include "sink.hpp"

#include <iostream>

namespace stderrx {

Sink stderr_sink() {
    return stream_sink(std::cerr);
}

Sink stream_sink(std::ostream& out) {
    return [&out](const std::string& text) {
        try {
            out << text << std::flush;
        } catch (const std::ios_base::failure&) {
            // Streams with exceptions() enabled report failure by throwing.
            return false;
        }
        return static_cast<bool>(out);
    };
}

} // namespace stderrx
