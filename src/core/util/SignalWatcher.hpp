#pragma once

#include <csignal>
#include <thread>
#include <atomic>
#include <string>
#include <functional>
#include <initializer_list>

namespace pyrunner::util {

/**
 * Waits for termination signals on a dedicated thread with sigwait().
 *
 * The signals must be blocked in every other thread, which is easiest done
 * by calling blockSignals() in main() before any thread is started.
 */
class SignalWatcher {
private:
    std::atomic<bool> shouldExit{false};
    std::atomic<bool> stopping{false};
    std::thread watcherThread;
    std::function<void(int)> signalCallback;

    static void logSignal(int sig);

public:
    SignalWatcher() = default;
    ~SignalWatcher();

    // Prevent copying
    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Move operations
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

    void start();
    void stop();

    // Runs on the watcher thread for SIGINT and SIGTERM
    void setSignalCallback(std::function<void(int)> callback) {
        signalCallback = std::move(callback);
    }

    bool shouldExitNow() const {
        return shouldExit.load(std::memory_order_relaxed);
    }
};

// Block specific signals in the calling thread. The default set is the one
// the watcher waits for.
void blockSignals(const std::initializer_list<int>& signalsToBlock = {SIGINT, SIGTERM, SIGHUP, SIGQUIT});

} // namespace pyrunner::util
