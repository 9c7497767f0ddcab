#include "RunEvents.hpp"
#include "../../utils/Logger.hpp"
#include "../../utils/Util.hpp"

namespace pyrunner {

std::string describeOutcome(const RunOutcome& outcome) {
    return std::visit(overloaded{
        [](const Completed& c) {
            return formatting::format("completed (exit code {}, {:.2f}s)", c.exitCode, c.elapsedSeconds);
        },
        [](const TimedOut& t) {
            return formatting::format("timed out after {:.2f}s", t.elapsedSeconds);
        },
        [](const Stopped& s) {
            return formatting::format("stopped after {:.2f}s", s.elapsedSeconds);
        },
        [](const SupervisorError& e) {
            return "error: " + e.message;
        },
    }, outcome);
}

void RunEventQueue::onOutput(const OutputEvent& event) {
    push(event);
}

void RunEventQueue::onFinished(const RunOutcome& outcome) {
    push(outcome);
}

void RunEventQueue::push(RunEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finishedPushed_) {
            warning("Dropping event reported after the terminal outcome");
            return;
        }
        if (isTerminal(event)) {
            finishedPushed_ = true;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

std::optional<RunEvent> RunEventQueue::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    RunEvent event = std::move(events_.front());
    events_.pop_front();
    if (isTerminal(event)) {
        closed_ = true;
    }
    return event;
}

RunEvent RunEventQueue::nextBlocking() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });
    RunEvent event = std::move(events_.front());
    events_.pop_front();
    if (isTerminal(event)) {
        closed_ = true;
    }
    return event;
}

bool RunEventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t RunEventQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace pyrunner
