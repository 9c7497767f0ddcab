#include "ProcessManager.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>

namespace pyrunner {

bool ProcessManager::isProcessAlive(pid_t pid) {
    if (pid <= 0) return false;
    return kill(pid, 0) == 0;
}

bool ProcessManager::signalGroup(pid_t pgid, int signal) {
    if (pgid <= 0) {
        return false;
    }
    return kill(-pgid, signal) == 0;
}

std::optional<int> ProcessManager::tryReap(pid_t pid) {
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == pid) {
        return decodeWaitStatus(status);
    }
    if (result == -1) {
        throw std::system_error(errno, std::generic_category(),
                                "waitpid(" + std::to_string(pid) + ")");
    }
    return std::nullopt;
}

int ProcessManager::decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

std::string ProcessManager::signalName(int signal) {
    switch (signal) {
        case SIGINT:  return "SIGINT";
        case SIGTERM: return "SIGTERM";
        case SIGKILL: return "SIGKILL";
        case SIGHUP:  return "SIGHUP";
        case SIGQUIT: return "SIGQUIT";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGPIPE: return "SIGPIPE";
        default: {
            const char* desc = strsignal(signal);
            return desc ? std::string(desc) : "signal " + std::to_string(signal);
        }
    }
}

} // namespace pyrunner
