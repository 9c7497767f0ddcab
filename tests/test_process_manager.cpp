#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include "core/process/ProcessManager.hpp"

using namespace pyrunner;

TEST(ProcessManagerTest, DecodesWaitStatus) {
    pid_t exited = fork();
    ASSERT_GE(exited, 0);
    if (exited == 0) {
        _exit(7);
    }
    int status = 0;
    ASSERT_EQ(waitpid(exited, &status, 0), exited);
    EXPECT_EQ(ProcessManager::decodeWaitStatus(status), 7);

    pid_t killed = fork();
    ASSERT_GE(killed, 0);
    if (killed == 0) {
        pause();
        _exit(0);
    }
    ASSERT_TRUE(ProcessManager::isProcessAlive(killed));
    kill(killed, SIGKILL);
    ASSERT_EQ(waitpid(killed, &status, 0), killed);
    EXPECT_EQ(ProcessManager::decodeWaitStatus(status), -SIGKILL);
    EXPECT_FALSE(ProcessManager::isProcessAlive(killed));
}

TEST(ProcessManagerTest, TryReapAndGroupSignal) {
    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        setpgid(0, 0);
        pause();
        _exit(0);
    }
    setpgid(child, child);
    EXPECT_FALSE(ProcessManager::tryReap(child).has_value());
    ASSERT_TRUE(ProcessManager::signalGroup(child, SIGTERM));

    std::optional<int> code;
    for (int i = 0; i < 200 && !code; ++i) {
        code = ProcessManager::tryReap(child);
        usleep(10000);
    }
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, -SIGTERM);
    EXPECT_THROW(ProcessManager::tryReap(child), std::system_error);
}

TEST(ProcessManagerTest, RejectsInvalidPids) {
    EXPECT_FALSE(ProcessManager::isProcessAlive(0));
    EXPECT_FALSE(ProcessManager::signalGroup(-1, SIGTERM));
}

TEST(ProcessManagerTest, SignalNames) {
    EXPECT_EQ(ProcessManager::signalName(SIGTERM), "SIGTERM");
    EXPECT_EQ(ProcessManager::signalName(SIGKILL), "SIGKILL");
    EXPECT_FALSE(ProcessManager::signalName(SIGUSR1).empty());
}
