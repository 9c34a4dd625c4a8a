#include "status.hpp"

namespace stderrx {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Io:
            return "io";
        case ErrorKind::Input:
            return "input";
        case ErrorKind::Layout:
            return "layout";
        case ErrorKind::HandleMisuse:
            return "handle misuse";
    }
    return "unknown";
}

const Error& Status::error() const {
    if (!error_) {
        throw std::logic_error("Status::error() called on an ok status");
    }
    return *error_;
}

std::string Status::to_string() const {
    if (!error_) {
        return "ok";
    }
    return std::string(stderrx::to_string(error_->kind)) + ": " + error_->message;
}

} // namespace stderrx
