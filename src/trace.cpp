#include "trace.hpp"
#include "logger.hpp"
#include "terminal.hpp"

#include <algorithm>

namespace stderrx {

// ========== TraceStack ==========

const TraceFrame& TraceStack::push(const std::string& name) {
    frames_.push_back(TraceFrame{next_id_++, name, frames_.size() + 1});
    return frames_.back();
}

bool TraceStack::remove(std::uint64_t id) {
    auto it = std::find_if(frames_.begin(), frames_.end(),
        [id](const TraceFrame& f) { return f.id == id; });
    if (it == frames_.end()) {
        return false;
    }

    it = frames_.erase(it);
    for (; it != frames_.end(); ++it) {
        it->depth--;
    }
    return true;
}

const TraceFrame* TraceStack::find(std::uint64_t id) const {
    auto it = std::find_if(frames_.begin(), frames_.end(),
        [id](const TraceFrame& f) { return f.id == id; });
    return it == frames_.end() ? nullptr : &(*it);
}

bool TraceStack::is_top(std::uint64_t id) const {
    return !frames_.empty() && frames_.back().id == id;
}

std::string TraceStack::indent(size_t depth) {
    if (depth <= 1) {
        return "";
    }
    return terminal::repeat(TRACE_CONTINUATION, static_cast<int>(depth - 1));
}

std::string TraceStack::header_line(size_t depth, const std::string& name, const std::string& text) {
    return indent(depth) + TRACE_HEADER_GLYPH + " " + name + ": " + text;
}

std::string TraceStack::step_line(size_t depth, const std::string& text) {
    return indent(depth) + TRACE_BRANCH + text;
}

std::string TraceStack::exit_line(size_t depth, const std::string& text) {
    return indent(depth) + TRACE_LAST_BRANCH + text;
}

std::string TraceStack::label_line(size_t depth, const std::string& label, const std::string& text) {
    return indent(depth) + "└┄┄[ " + label + " ] " + text;
}

// ========== TraceScope ==========

TraceScope::TraceScope(Logger* logger, std::uint64_t id, std::string name, Status entry_status)
    : logger_(logger)
    , id_(id)
    , name_(std::move(name))
    , entry_status_(std::move(entry_status))
{
}

TraceScope::TraceScope(TraceScope&& other) noexcept
    : logger_(other.logger_)
    , id_(other.id_)
    , name_(std::move(other.name_))
    , entry_status_(std::move(other.entry_status_))
{
    other.logger_ = nullptr;
}

TraceScope::~TraceScope() {
    if (logger_) {
        logger_->trace_release(id_);
    }
}

Status TraceScope::step(const std::string& text) {
    if (!logger_) {
        return Status::failure(ErrorKind::HandleMisuse,
            "trace frame '" + name_ + "' was already released");
    }
    return logger_->trace_step(id_, text);
}

Status TraceScope::exit(const std::string& text) {
    if (!logger_) {
        return Status::failure(ErrorKind::HandleMisuse,
            "trace frame '" + name_ + "' was already released");
    }

    Status status = logger_->trace_exit(id_, text);
    if (status.is_ok() || status.kind() != ErrorKind::HandleMisuse) {
        // Frame is closed even when the exit line could not be written.
        logger_ = nullptr;
    }
    return status;
}

bool TraceScope::is_top() const {
    return logger_ && logger_->trace_.is_top(id_);
}

size_t TraceScope::depth() const {
    if (!logger_) {
        return 0;
    }
    const TraceFrame* frame = logger_->trace_.find(id_);
    return frame ? frame->depth : 0;
}

} // namespace stderrx
