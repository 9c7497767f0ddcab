#include "SignalWatcher.hpp"
#include "../../utils/Logger.hpp"
#include "../process/ProcessManager.hpp"
#include <cerrno>
#include <pthread.h>
#include <stdexcept>
#include <system_error>

namespace pyrunner::util {

void SignalWatcher::logSignal(int sig) {
    info("[SignalWatcher] Received signal: {} ({})", ProcessManager::signalName(sig), sig);
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (watcherThread.joinable()) {
        throw std::runtime_error("SignalWatcher already running");
    }
    stopping.store(false, std::memory_order_relaxed);

    watcherThread = std::thread([this]() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        sigaddset(&set, SIGQUIT);

        int sig;
        while (true) {
            // sigwait returns the error number instead of setting errno
            int result = sigwait(&set, &sig);
            if (result != 0) {
                if (result == EINTR) continue;
                std::error_code ec(result, std::system_category());
                error("[SignalWatcher] sigwait failed: {}", ec.message());
                break;
            }
            if (stopping.load(std::memory_order_relaxed)) {
                break;
            }
            logSignal(sig);
            if (sig == SIGINT || sig == SIGTERM) {
                shouldExit.store(true, std::memory_order_relaxed);
                if (signalCallback) {
                    signalCallback(sig);
                }
            }
        }
    });
}

void SignalWatcher::stop() {
    if (watcherThread.joinable()) {
        // Wake sigwait with a signal the thread ignores once stopping is set
        stopping.store(true, std::memory_order_relaxed);
        pthread_kill(watcherThread.native_handle(), SIGTERM);
        watcherThread.join();
    }
}

void blockSignals(const std::initializer_list<int>& signals) {
    sigset_t set;
    sigemptyset(&set);
    for (int sig : signals) {
        sigaddset(&set, sig);
    }
    // pthread_sigmask returns the error number instead of setting errno
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::system_category(), "Failed to block signals");
    }
}

} // namespace pyrunner::util
