#pragma once

/**
 * Result values returned by every rendering call.
 *
 * Nothing in stderrx terminates or throws on a runtime failure: a failed sink
 * write, unreadable prompt input, an impossible layout or a misused trace
 * handle all come back to the caller as a Status or Result.
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace stderrx {

// Failure categories.
enum class ErrorKind {
    Io,            // Sink write failed.
    Input,         // Confirmation input unreadable or at end of stream.
    Layout,        // Layout request cannot be satisfied.
    HandleMisuse   // Trace handle is not the top frame or already released.
};

// Returns a short lowercase name for the kind ("io", "input", ...).
const char* to_string(ErrorKind kind);

struct Error {
    ErrorKind kind;
    std::string message;
};

/**
 * Outcome of an operation that produces no value.
 */
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }

    static Status failure(ErrorKind kind, std::string message) {
        Status status;
        status.error_ = Error{kind, std::move(message)};
        return status;
    }

    bool is_ok() const { return !error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    // Throws std::logic_error when the status is ok.
    const Error& error() const;

    ErrorKind kind() const { return error().kind; }
    const std::string& message() const { return error().message; }

    // "ok" or "<kind>: <message>".
    std::string to_string() const;

private:
    std::optional<Error> error_;
};

/**
 * Outcome of an operation that produces a value of type T.
 */
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(Error error) : error_(std::move(error)) {}

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool is_ok() const { return value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result::value() called on a failed result: " + error_->message);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result::value() called on a failed result: " + error_->message);
        }
        return *value_;
    }

    const Error& error() const {
        if (!error_) {
            throw std::logic_error("Result::error() called on a successful result");
        }
        return *error_;
    }

    // Drops the value, keeping only success or failure.
    Status status() const {
        if (error_) {
            return Status::failure(error_->kind, error_->message);
        }
        return Status::ok();
    }

private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace stderrx
