#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace blobkit {

/// Cancellation token plus optional deadline, passed to every store operation.
///
/// Copies share state: cancelling one copy cancels all of them. A derived
/// context (with_timeout/with_deadline) observes its parent's cancellation
/// and keeps the earlier of the two deadlines.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// Never cancelled, no deadline.
    static Context background();

    Context with_timeout(std::chrono::milliseconds timeout) const;
    Context with_deadline(Clock::time_point deadline) const;

    /// Cancel this context and everything derived from it.
    void cancel() const;

    bool cancelled() const;
    bool deadline_exceeded() const;

    /// True once cancelled or past the deadline.
    bool done() const { return cancelled() || deadline_exceeded(); }

    std::optional<Clock::time_point> deadline() const;

    /// Time left until the deadline (zero if past), nullopt if there is none.
    std::optional<std::chrono::milliseconds> remaining() const;

    /// Human-readable reason for done(), empty while still live.
    const char* err() const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
    };

    explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

} // namespace blobkit
