#pragma once

#include "boxes.hpp"
#include "status.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace stderrx {

class Logger;

/**
 * A builder for a confirmation prompt.
 *
 * Created via Logger::confirm_builder(). Setters return the builder so they
 * can be chained; ask() renders the prompt and reads one answer:
 *
 *   auto answer = log.confirm_builder("Delete everything?")
 *       .boxed(true)
 *       .style(BorderStyle::Heavy)
 *       .ask();
 *
 * y → true, n → false, q → empty optional. Input is matched on its first
 * non-blank character, case-insensitive.
 */
class ConfirmBuilder {
public:
    ConfirmBuilder(Logger& logger, std::string prompt);

    // Draws the prompt text inside a box before asking.
    ConfirmBuilder& boxed(bool use_box);

    // Border style of the box, if enabled.
    ConfirmBuilder& style(BorderStyle style);

    // Palette color for the question line (default: bold white).
    ConfirmBuilder& prompt_color(int color);

    // Answer returned for empty input. Without one, empty input re-prompts.
    ConfirmBuilder& default_answer(bool answer);

    // Stream answers are read from (default: std::cin).
    ConfirmBuilder& input(std::istream& in);

    // The question line shown before reading, e.g. "Continue? [y/n/q] > ".
    std::string question() const;

    /**
     * Asks until a valid answer is read.
     * Fails with an Input error at end of stream and an Io error if the
     * prompt can't be written. In quiet mode nothing is shown and the
     * default answer (true when none is set) is returned.
     */
    Result<std::optional<bool>> ask();

private:
    Logger& logger_;
    std::string prompt_;
    bool use_box_ = false;
    BorderStyle style_ = BorderStyle::Light;
    std::optional<int> prompt_color_;
    std::optional<bool> default_answer_;
    std::istream* input_;
};

} // namespace stderrx
