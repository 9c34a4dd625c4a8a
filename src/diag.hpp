#pragma once

/**
 * Diagnostics for stderrx itself.
 *
 * Reports conditions that have no caller to return a Status to (a trace
 * handle released out of order by its destructor, an unreadable config file)
 * when diagnostics are enabled via set_diagnostics() or STDERRX_DIAG.
 *
 * Lines look like
 *
 *   [14:02:11.347] stderrx/config: loaded .stderrx.json
 *   [14:02:11.352] stderrx/trace error: frame 'load' released while inner frames are open
 *
 * and go to stderr unless another sink is installed.
 */

#include "sink.hpp"
#include "style.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <utility>

namespace stderrx {

inline bool g_diagnostics = std::getenv("STDERRX_DIAG") != nullptr;

inline void set_diagnostics(bool enabled) {
    g_diagnostics = enabled;
}

inline bool diagnostics_enabled() {
    return g_diagnostics;
}

// Destination of diagnostic lines. The sink must not throw.
inline Sink& diag_sink() {
    static Sink sink = stderr_sink();
    return sink;
}

inline void set_diag_sink(Sink sink) {
    diag_sink() = std::move(sink);
}

// Local wall-clock time as "HH:MM:SS.mmm".
inline std::string diag_clock() {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);

    std::tm local;
    localtime_r(&secs, &local);

    char hms[16];
    std::strftime(hms, sizeof(hms), "%H:%M:%S", &local);
    char out[24];
    std::snprintf(out, sizeof(out), "%s.%03ld", hms, millis);
    return out;
}

// One rendered diagnostic line, newline included.
inline std::string diag_line(const std::string& category, const std::string& message, bool error) {
    std::string tag = "stderrx/" + category + (error ? " error" : "");
    return ansi::fg(palette::GREY) + "[" + diag_clock() + "] " + ansi::RESET +
           ansi::fg(error ? palette::RED : palette::BLUE) + tag + ":" + ansi::RESET +
           " " + message + "\n";
}

inline void diag_emit(const std::string& line) {
    if (!g_diagnostics || !diag_sink()) return;
    // A failed diagnostic write has nowhere left to be reported.
    static_cast<void>(diag_sink()(line));
}

inline void diag_log(const std::string& category, const std::string& message) {
    if (!g_diagnostics) return;
    diag_emit(diag_line(category, message, false));
}

inline void diag_err(const std::string& category, const std::string& message) {
    if (!g_diagnostics) return;
    diag_emit(diag_line(category, message, true));
}

} // namespace stderrx
