#include "confirm.hpp"
#include "logger.hpp"
#include "style.hpp"

#include <cctype>
#include <iostream>

namespace stderrx {

namespace {

// First non-blank character of a line, lowercased, or 0 if the line is blank.
char first_answer_char(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return 0;
}

} // namespace

ConfirmBuilder::ConfirmBuilder(Logger& logger, std::string prompt)
    : logger_(logger)
    , prompt_(std::move(prompt))
    , input_(&std::cin)
{
}

ConfirmBuilder& ConfirmBuilder::boxed(bool use_box) {
    use_box_ = use_box;
    return *this;
}

ConfirmBuilder& ConfirmBuilder::style(BorderStyle style) {
    style_ = style;
    return *this;
}

ConfirmBuilder& ConfirmBuilder::prompt_color(int color) {
    prompt_color_ = color;
    return *this;
}

ConfirmBuilder& ConfirmBuilder::default_answer(bool answer) {
    default_answer_ = answer;
    return *this;
}

ConfirmBuilder& ConfirmBuilder::input(std::istream& in) {
    input_ = &in;
    return *this;
}

std::string ConfirmBuilder::question() const {
    std::string choices = "[y/n/q]";
    if (default_answer_) {
        choices = *default_answer_ ? "[Y/n/q]" : "[y/N/q]";
    }

    if (use_box_) {
        return "Your choice " + choices + " -> ";
    }
    return prompt_ + " " + choices + " > ";
}

Result<std::optional<bool>> ConfirmBuilder::ask() {
    if (logger_.config().quiet) {
        return std::optional<bool>(default_answer_.value_or(true));
    }

    if (use_box_) {
        Status status = logger_.boxed(prompt_, style_);
        if (!status) {
            return status.error();
        }
    }

    int color = prompt_color_.value_or(palette::WHITE);
    std::string line;
    while (true) {
        Status status = logger_.write(logger_.paint(question(), color, true));
        if (!status) {
            return status.error();
        }

        if (!std::getline(*input_, line)) {
            return Result<std::optional<bool>>::failure(
                ErrorKind::Input, "end of input while waiting for an answer");
        }

        switch (first_answer_char(line)) {
            case 'y':
                return std::optional<bool>(true);
            case 'n':
                return std::optional<bool>(false);
            case 'q':
                return std::optional<bool>();
            case 0:
                if (default_answer_) {
                    return std::optional<bool>(*default_answer_);
                }
                break;
            default: {
                Status warned = logger_.warn("Please answer y, n or q.");
                if (!warned) {
                    return warned.error();
                }
                break;
            }
        }
    }
}

} // namespace stderrx
