#pragma once

#include <condition_variable>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace pyrunner {

/**
 * One line of child output. Trailing whitespace is stripped and malformed
 * UTF-8 is already replaced with U+FFFD.
 */
struct OutputEvent {
    std::string line;
};

struct Completed {
    int exitCode = 0;        ///< Exit status, or -signal when killed by a signal
    double elapsedSeconds = 0.0;
};

struct TimedOut {
    double elapsedSeconds = 0.0;
};

struct Stopped {
    double elapsedSeconds = 0.0;
};

struct SupervisorError {
    std::string message;
};

// Terminal outcome of a run. Exactly one is reported per session, always last.
using RunOutcome = std::variant<Completed, TimedOut, Stopped, SupervisorError>;

using RunEvent = std::variant<OutputEvent, RunOutcome>;

std::string describeOutcome(const RunOutcome& outcome);

inline bool isTerminal(const RunEvent& event) {
    return std::holds_alternative<RunOutcome>(event);
}

/**
 * Receives the events of one run. Called on the supervisor's worker thread;
 * implementations marshal to their own thread as needed.
 */
class RunListener {
public:
    virtual ~RunListener() = default;
    virtual void onOutput(const OutputEvent& event) = 0;
    // Last call of the run. The supervisor is already idle, so the next
    // session may be started from here.
    virtual void onFinished(const RunOutcome& outcome) = 0;
};

/**
 * Thread-safe FIFO of run events for pull-style consumers.
 */
class RunEventQueue : public RunListener {
public:
    void onOutput(const OutputEvent& event) override;
    void onFinished(const RunOutcome& outcome) override;

    // Waits up to timeout for the next event
    std::optional<RunEvent> next(std::chrono::milliseconds timeout);
    // Waits without bound for the next event
    RunEvent nextBlocking();

    // True once the terminal outcome has been dequeued
    bool closed() const;
    size_t pending() const;

private:
    void push(RunEvent event);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RunEvent> events_;
    bool finishedPushed_ = false;
    bool closed_ = false;
};

} // namespace pyrunner
