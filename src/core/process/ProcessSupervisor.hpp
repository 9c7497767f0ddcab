#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <sys/types.h>

#include "ExecutionSession.hpp"
#include "RunEvents.hpp"
#include "../util/Env.hpp"

namespace pyrunner {

class Configs;

/**
 * @brief Runs one child process per session on a worker thread.
 *
 * The child's stdout and stderr share a single pipe so the listener sees
 * one ordered stream. Every run ends with exactly one RunOutcome:
 * Completed, TimedOut, Stopped or SupervisorError.
 */
class ProcessSupervisor {
public:
    struct Options {
        std::chrono::milliseconds pollInterval{50};
        // Time between SIGTERM and SIGKILL, also bounds the final drain
        std::chrono::milliseconds terminateGrace{2000};
        // Longer runs without a newline are split into lines of this size
        size_t maxLineBytes = 1 << 20;
    };

    // Poll interval and grace period from the Runner.* settings
    static Options optionsFrom(const Configs& config);

    ProcessSupervisor();
    explicit ProcessSupervisor(Options options);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    // Returns immediately. The listener must outlive the run.
    // Throws std::logic_error if a run is already active or the supervisor
    // is being destroyed. May be called from RunListener::onFinished.
    void start(ExecutionSession session, RunListener& listener);

    // Idempotent and non-blocking; a no-op when nothing is running
    void requestStop();

    // Joins the workers of finished runs, including runs started from
    // onFinished. Skips the calling thread when called from a listener.
    void wait();

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }
    pid_t currentPid() const;

    const Options& options() const noexcept { return options_; }

    // Child environment: inherited, overlaid with the session's variables,
    // search paths prepended, UTF-8 stream encoding requested
    static Env::Map buildEnvironment(const ExecutionSession& session, Env::Map inherited);

private:
    using Clock = std::chrono::steady_clock;

    void runWorker(ExecutionSession session, RunListener& listener);
    pid_t spawn(const ExecutionSession& session, int& outputFd);
    RunOutcome supervise(const ExecutionSession& session, pid_t pid, int outputFd,
                         RunListener& listener, Clock::time_point started);

    // A worker that is not the calling thread, moved out of its slot.
    // workerMutex_ must be held.
    std::thread takeJoinableWorker();

    // Reaps the child if it exited; clears childPid_ under the lock
    std::optional<int> reapIfExited(pid_t pid);
    // Polls until reaped, escalating to SIGKILL at killAt
    int reapBlocking(pid_t pid, Clock::time_point killAt);
    // SIGKILL to the group and a blocking waitpid, unless already reaped
    void killAndReap(pid_t pid) noexcept;
    void releaseGroup();

    Options options_;

    std::mutex workerMutex_;
    std::thread worker_;
    // Worker that started its successor from onFinished
    std::thread finishedWorker_;
    bool shuttingDown_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};

    mutable std::mutex pidMutex_;
    pid_t childPid_ = -1;
    // Outlives childPid_: background members may hold the output pipe
    // after the leader is reaped
    pid_t childGroup_ = -1;
};

} // namespace pyrunner
