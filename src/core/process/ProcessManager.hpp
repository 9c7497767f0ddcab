#pragma once
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <csignal>
#include <optional>
#include <string>

namespace pyrunner {

class ProcessManager {
public:
    static bool isProcessAlive(pid_t pid);
    // Signals every member of the process group led by pgid
    static bool signalGroup(pid_t pgid, int signal);

    // Non-blocking waitpid. Returns the decoded exit code once the child
    // has been reaped, nullopt while it is still running.
    static std::optional<int> tryReap(pid_t pid);

    // Exit status for a normal exit, -signal for a signal death
    static int decodeWaitStatus(int status);
    static std::string signalName(int signal);
};

} // namespace pyrunner
