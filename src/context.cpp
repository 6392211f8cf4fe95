#include "blobkit/core/context.hpp"

#include <algorithm>

namespace blobkit {

Context Context::background() {
    return Context(std::make_shared<State>());
}

Context Context::with_deadline(Clock::time_point deadline) const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    auto inherited = this->deadline();
    child->deadline = inherited ? std::min(*inherited, deadline) : deadline;
    return Context(std::move(child));
}

Context Context::with_timeout(std::chrono::milliseconds timeout) const {
    return with_deadline(Clock::now() + timeout);
}

void Context::cancel() const {
    state_->cancelled.store(true, std::memory_order_release);
}

bool Context::cancelled() const {
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->cancelled.load(std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    // Children already fold in the parent's deadline at creation
    return state_->deadline;
}

bool Context::deadline_exceeded() const {
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<std::chrono::milliseconds> Context::remaining() const {
    if (!state_->deadline) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *state_->deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

const char* Context::err() const {
    if (cancelled()) {
        return "context cancelled";
    }
    if (deadline_exceeded()) {
        return "context deadline exceeded";
    }
    return "";
}

} // namespace blobkit
