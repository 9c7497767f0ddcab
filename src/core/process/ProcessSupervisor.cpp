#include "ProcessSupervisor.hpp"
#include "ProcessManager.hpp"
#include "../ConfigManager.hpp"
#include "../../utils/Logger.hpp"
#include "../../utils/Utf8.hpp"
#include "../../utils/Util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>

namespace pyrunner {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound of bytes consumed per poll iteration so that a chatty child
// cannot starve the stop and timeout checks
constexpr size_t kReadChunk = 4096;
constexpr int kMaxChunksPerIteration = 16;

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    int get() const { return fd_; }
    int release() { return std::exchange(fd_, -1); }
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

// Cuts the merged output stream into lines and forwards each one.
// A run of maxLine bytes without a newline is forwarded as its own line.
class LineAssembler {
public:
    LineAssembler(RunListener& listener, size_t maxLine)
        : listener_(listener), maxLine_(maxLine > 0 ? maxLine : 1) {}

    void feed(const char* data, size_t len, bool emit) {
        pending_.append(data, len);
        size_t start = 0;
        size_t newline;
        while ((newline = pending_.find('\n', start)) != std::string::npos) {
            if (emit) {
                emitLine(std::string_view(pending_).substr(start, newline - start));
            }
            start = newline + 1;
        }
        while (pending_.size() - start >= maxLine_) {
            if (emit) {
                emitLine(std::string_view(pending_).substr(start, maxLine_));
            }
            start += maxLine_;
        }
        pending_.erase(0, start);
    }

    // Flushes a final line that had no terminating newline
    void finish(bool emit) {
        if (emit && !pending_.empty()) {
            emitLine(pending_);
        }
        pending_.clear();
    }

    size_t emitted() const { return emitted_; }

private:
    void emitLine(std::string_view raw) {
        std::string line = utf8::trimRight(utf8::sanitize(raw));
        if (line.empty()) {
            return;
        }
        ++emitted_;
        listener_.onOutput(OutputEvent{std::move(line)});
    }

    RunListener& listener_;
    const size_t maxLine_;
    std::string pending_;
    size_t emitted_ = 0;
};

enum class ReadStatus { Data, Idle, Eof };

ReadStatus readAvailable(int fd, LineAssembler& lines, bool emit) {
    char buffer[kReadChunk];
    bool gotData = false;
    for (int chunk = 0; chunk < kMaxChunksPerIteration; ) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            lines.feed(buffer, static_cast<size_t>(n), emit);
            gotData = true;
            ++chunk;
            continue;
        }
        if (n == 0) {
            return ReadStatus::Eof;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        throw std::system_error(errno, std::generic_category(), "read from child output");
    }
    return gotData ? ReadStatus::Data : ReadStatus::Idle;
}

bool waitReadable(int fd, std::chrono::milliseconds timeout) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw std::system_error(errno, std::generic_category(), "poll on child output");
    }
    return rc > 0;
}

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Child side of a failed spawn. Only async-signal-safe calls from here on;
// the parent learns the errno through the close-on-exec status pipe.
[[noreturn]] void reportSpawnFailure(int statusFd, int err) {
    ssize_t written = ::write(statusFd, &err, sizeof(err));
    _exit(written == static_cast<ssize_t>(sizeof(err)) ? 127 : 126);
}

} // namespace

ProcessSupervisor::ProcessSupervisor() : ProcessSupervisor(Options{}) {}

ProcessSupervisor::ProcessSupervisor(Options options) : options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
    {
        std::lock_guard<std::mutex> lock(workerMutex_);
        shuttingDown_ = true;
    }
    requestStop();
    wait();
}

ProcessSupervisor::Options ProcessSupervisor::optionsFrom(const Configs& config) {
    Options options;
    options.pollInterval = std::chrono::milliseconds(config.GetPollIntervalMs());
    options.terminateGrace = std::chrono::milliseconds(config.GetTerminateGraceMs());
    return options;
}

void ProcessSupervisor::start(ExecutionSession session, RunListener& listener) {
    std::unique_lock<std::mutex> lock(workerMutex_);
    while (true) {
        if (shuttingDown_) {
            throw std::logic_error("The supervisor is shutting down");
        }
        if (running_.load(std::memory_order_acquire)) {
            throw std::logic_error("A script is already running");
        }
        // Joined unlocked: the old worker may itself be calling start()
        std::thread previous = takeJoinableWorker();
        if (!previous.joinable()) {
            break;
        }
        lock.unlock();
        previous.join();
        lock.lock();
    }
    // Still joinable here only when called from onFinished on the worker itself
    if (worker_.joinable()) {
        finishedWorker_ = std::move(worker_);
    }

    stopRequested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    try {
        worker_ = std::thread(&ProcessSupervisor::runWorker, this, std::move(session), std::ref(listener));
    } catch (const std::system_error&) {
        running_.store(false, std::memory_order_release);
        throw;
    }
}

void ProcessSupervisor::requestStop() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    if (stopRequested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard<std::mutex> lock(pidMutex_);
    if (childGroup_ > 0) {
        info("Stop requested, sending SIGTERM to process group {}", childGroup_);
        ProcessManager::signalGroup(childGroup_, SIGTERM);
    } else {
        info("Stop requested before the child started");
    }
}

void ProcessSupervisor::wait() {
    std::unique_lock<std::mutex> lock(workerMutex_);
    while (true) {
        std::thread previous = takeJoinableWorker();
        if (!previous.joinable()) {
            return;
        }
        lock.unlock();
        previous.join();
        lock.lock();
    }
}

std::thread ProcessSupervisor::takeJoinableWorker() {
    const auto self = std::this_thread::get_id();
    if (worker_.joinable() && worker_.get_id() != self) {
        return std::move(worker_);
    }
    if (finishedWorker_.joinable() && finishedWorker_.get_id() != self) {
        return std::move(finishedWorker_);
    }
    return {};
}

pid_t ProcessSupervisor::currentPid() const {
    std::lock_guard<std::mutex> lock(pidMutex_);
    return childPid_;
}

Env::Map ProcessSupervisor::buildEnvironment(const ExecutionSession& session, Env::Map inherited) {
    Env::Map env = Env::overlay(std::move(inherited), session.extraEnvironment());

    if (!session.extraSearchPaths().empty()) {
        const std::string& variable = session.searchPathVariable();
        auto it = env.find(variable);
        std::string existing = it != env.end() ? it->second : std::string();
        env[variable] = Env::prependPathList(session.extraSearchPaths(), existing);
    }

    env["PYTHONIOENCODING"] = "utf-8";
    if (session.forceUtf8()) {
        env["PYTHONLEGACYWINDOWSFSENCODING"] = "0";
        env["PYTHONLEGACYWINDOWSSTDIO"] = "0";
    }
    return env;
}

void ProcessSupervisor::runWorker(ExecutionSession session, RunListener& listener) {
    const auto started = Clock::now();
    std::optional<RunOutcome> outcome;

    try {
        if (stopRequested_.load(std::memory_order_acquire)) {
            outcome = Stopped{0.0};
        } else {
            int rawFd = -1;
            pid_t pid = spawn(session, rawFd);
            UniqueFd output(rawFd);
            try {
                outcome = supervise(session, pid, output.get(), listener, started);
            } catch (const std::exception&) {
                killAndReap(pid);
                throw;
            }
        }
    } catch (const std::exception& e) {
        error("Run of {} failed: {}", session.scriptPath(), e.what());
        outcome = SupervisorError{e.what()};
    }

    info("Run of {} {}", session.scriptPath(), describeOutcome(*outcome));

    // Cleared before the terminal event so the observer may start the next run
    running_.store(false, std::memory_order_release);
    try {
        listener.onFinished(*outcome);
    } catch (const std::exception& e) {
        error("Listener failed to handle the run outcome: {}", e.what());
    }
}

pid_t ProcessSupervisor::spawn(const ExecutionSession& session, int& outputFd) {
    // Everything the child touches is prepared before fork
    const std::vector<std::string> args = session.commandLine();
    const std::vector<std::string> envEntries =
        Env::toEntries(buildEnvironment(session, Env::getAll()));
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (const auto& entry : envEntries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);
    const char* workDir = session.workingDirectory().empty() ? nullptr : session.workingDirectory().c_str();

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe for child output");
    }
    UniqueFd outRead(fds[0]);
    UniqueFd outWrite(fds[1]);
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe for spawn status");
    }
    UniqueFd statusRead(fds[0]);
    UniqueFd statusWrite(fds[1]);
    UniqueFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (devNull.get() < 0) {
        throw std::system_error(errno, std::generic_category(), "open /dev/null");
    }

    debug("Spawning: {}", join(args, " "));

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Own process group so termination reaches grandchildren too
        ::setpgid(0, 0);

        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        ::sigaction(SIGPIPE, &dfl, nullptr);
        ::sigaction(SIGINT, &dfl, nullptr);
        ::sigaction(SIGTERM, &dfl, nullptr);

        if (::dup2(devNull.get(), STDIN_FILENO) < 0 ||
            ::dup2(outWrite.get(), STDOUT_FILENO) < 0 ||
            ::dup2(outWrite.get(), STDERR_FILENO) < 0) {
            reportSpawnFailure(statusWrite.get(), errno);
        }
        if (workDir && ::chdir(workDir) != 0) {
            reportSpawnFailure(statusWrite.get(), errno);
        }
        ::execve(argv[0], argv.data(), envp.data());
        reportSpawnFailure(statusWrite.get(), errno);
    }

    {
        std::lock_guard<std::mutex> lock(pidMutex_);
        childPid_ = pid;
        childGroup_ = pid;
    }
    // Also set from the parent so the group exists before any signal is sent
    ::setpgid(pid, pid);

    outWrite.reset();
    statusWrite.reset();
    devNull.reset();

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusRead.get(), &childErrno, sizeof(childErrno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        killAndReap(pid);
        throw std::system_error(childErrno, std::generic_category(),
                                "Failed to start " + session.interpreterPath());
    }

    int flags = ::fcntl(outRead.get(), F_GETFL);
    if (flags < 0 || ::fcntl(outRead.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        killAndReap(pid);
        throw std::system_error(err, std::generic_category(), "fcntl on child output");
    }

    info("Started {} (pid {}, timeout {}s)", session.scriptPath(), pid, session.timeoutSeconds());
    outputFd = outRead.release();
    return pid;
}

RunOutcome ProcessSupervisor::supervise(const ExecutionSession& session, pid_t pid, int outputFd,
                                        RunListener& listener, Clock::time_point started) {
    LineAssembler lines(listener, options_.maxLineBytes);
    const int timeout = session.timeoutSeconds();
    bool eof = false;
    bool timedOut = false;
    bool stopped = false;
    std::optional<int> exitCode;

    while (true) {
        if (stopRequested_.load(std::memory_order_acquire)) {
            if (!exitCode) {
                ProcessManager::signalGroup(pid, SIGTERM);
            }
            stopped = true;
            break;
        }
        if (timeout > 0 && secondsSince(started) > timeout) {
            info("Timeout of {}s reached, terminating process group {}", timeout, pid);
            if (!exitCode) {
                ProcessManager::signalGroup(pid, SIGTERM);
            }
            timedOut = true;
            break;
        }
        if (exitCode) {
            break;
        }

        if (!eof) {
            if (waitReadable(outputFd, options_.pollInterval)) {
                bool emit = !stopRequested_.load(std::memory_order_acquire);
                eof = readAvailable(outputFd, lines, emit) == ReadStatus::Eof;
            }
        } else {
            std::this_thread::sleep_for(options_.pollInterval);
        }
        exitCode = reapIfExited(pid);
    }

    // Final drain: late-flushed output is still delivered, except after a stop
    bool terminating = stopped || timedOut;
    auto killAt = Clock::now() + options_.terminateGrace;
    auto giveUpAt = killAt + (terminating ? options_.terminateGrace : std::chrono::milliseconds(0));
    bool killed = false;
    while (!eof) {
        auto now = Clock::now();
        if (!terminating && stopRequested_.load(std::memory_order_acquire)) {
            // Leader already exited; background members still hold the pipe
            info("Stop requested while draining, terminating process group {}", pid);
            ProcessManager::signalGroup(pid, SIGTERM);
            stopped = true;
            terminating = true;
            killAt = now + options_.terminateGrace;
            giveUpAt = killAt + options_.terminateGrace;
        }
        if (terminating && !killed && now >= killAt) {
            warning("Process group {} ignored SIGTERM, sending SIGKILL", pid);
            ProcessManager::signalGroup(pid, SIGKILL);
            killed = true;
        }
        if (now >= giveUpAt) {
            warning("Output of process group {} still open, abandoning the drain", pid);
            break;
        }
        if (waitReadable(outputFd, options_.pollInterval)) {
            bool emit = !stopped && !stopRequested_.load(std::memory_order_acquire);
            eof = readAvailable(outputFd, lines, emit) == ReadStatus::Eof;
        }
    }
    // A stop that raced the last read has already suppressed its lines
    if (!terminating && stopRequested_.load(std::memory_order_acquire)) {
        stopped = true;
    }
    lines.finish(!stopped);

    if (!exitCode) {
        exitCode = reapBlocking(pid, killAt);
    }
    releaseGroup();

    const double elapsed = secondsSince(started);
    debug("{} output lines, exit code {}", lines.emitted(), *exitCode);
    if (stopped) {
        return Stopped{elapsed};
    }
    if (timedOut) {
        return TimedOut{elapsed};
    }
    if (*exitCode < 0) {
        warning("{} was killed by {}", session.scriptPath(), ProcessManager::signalName(-*exitCode));
    }
    return Completed{*exitCode, elapsed};
}

std::optional<int> ProcessSupervisor::reapIfExited(pid_t pid) {
    std::lock_guard<std::mutex> lock(pidMutex_);
    auto code = ProcessManager::tryReap(pid);
    if (code) {
        childPid_ = -1;
    }
    return code;
}

int ProcessSupervisor::reapBlocking(pid_t pid, Clock::time_point killAt) {
    bool killed = false;
    while (true) {
        if (auto code = reapIfExited(pid)) {
            return *code;
        }
        if (!killed && Clock::now() >= killAt) {
            ProcessManager::signalGroup(pid, SIGKILL);
            killed = true;
        }
        std::this_thread::sleep_for(options_.pollInterval);
    }
}

void ProcessSupervisor::killAndReap(pid_t pid) noexcept {
    std::lock_guard<std::mutex> lock(pidMutex_);
    if (childGroup_ == pid) {
        ProcessManager::signalGroup(pid, SIGKILL);
        childGroup_ = -1;
    }
    if (childPid_ != pid) {
        return;
    }
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    childPid_ = -1;
}

void ProcessSupervisor::releaseGroup() {
    std::lock_guard<std::mutex> lock(pidMutex_);
    childGroup_ = -1;
}

} // namespace pyrunner
