#include <gtest/gtest.h>
#include "core/ConfigManager.hpp"
#include "core/process/ProcessSupervisor.hpp"
#include "TestSupport.hpp"

using namespace pyrunner;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { Configs::Get().Clear(); }
    void TearDown() override { Configs::Get().Clear(); }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    auto& config = Configs::Get();
    EXPECT_FALSE(config.Load("/pyrunner/does/not/exist.cfg"));
    EXPECT_EQ(config.GetInterpreter(), "python3");
    EXPECT_EQ(config.GetTimeoutSeconds(), 30);
    EXPECT_EQ(config.GetPollIntervalMs(), 50);
    EXPECT_EQ(config.GetTerminateGraceMs(), 2000);
    EXPECT_EQ(config.GetSearchPathVariable(), "PYTHONPATH");
    EXPECT_TRUE(config.GetForceUtf8());
    EXPECT_EQ(config.GetLogLevel(), "info");
}

TEST_F(ConfigTest, SectionsAndComments) {
    auto& config = Configs::Get();
    config.LoadFromString(
        "# runner settings\n"
        "[Runner]\n"
        "Interpreter = /opt/python/bin/python3\n"
        "TimeoutSeconds=5\n"
        "; disabled\n"
        "ForceUtf8=no\n"
        "\n"
        "[Log]\n"
        "Level=debug\n");
    EXPECT_EQ(config.GetInterpreter(), "/opt/python/bin/python3");
    EXPECT_EQ(config.GetTimeoutSeconds(), 5);
    EXPECT_FALSE(config.GetForceUtf8());
    EXPECT_EQ(config.GetLogLevel(), "debug");
    EXPECT_TRUE(config.Has("Runner.TimeoutSeconds"));
    EXPECT_FALSE(config.Has("TimeoutSeconds"));
}

TEST_F(ConfigTest, InvalidAndOutOfRangeValuesFallBack) {
    auto& config = Configs::Get();
    config.LoadFromString(
        "[Runner]\n"
        "TimeoutSeconds=soon\n"
        "PollIntervalMs=0\n"
        "TerminateGraceMs=-5\n");
    EXPECT_EQ(config.GetTimeoutSeconds(), Configs::DEFAULT_TIMEOUT_SECONDS);
    EXPECT_EQ(config.GetPollIntervalMs(), Configs::DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(config.GetTerminateGraceMs(), Configs::DEFAULT_TERMINATE_GRACE_MS);
}

TEST_F(ConfigTest, LoadReadsFileAndRemembersPath) {
    test::TempDir dir;
    std::string path = dir.file("pyrunner.cfg", "[Runner]\nSearchPathVariable=MYPATH\n");
    auto& config = Configs::Get();
    ASSERT_TRUE(config.Load(path));
    EXPECT_EQ(config.getPath(), path);
    EXPECT_EQ(config.GetSearchPathVariable(), "MYPATH");
}

TEST_F(ConfigTest, SupervisorOptionsFollowRunnerSettings) {
    auto& config = Configs::Get();
    config.LoadFromString("[Runner]\nPollIntervalMs=25\nTerminateGraceMs=750\n");
    auto options = ProcessSupervisor::optionsFrom(config);
    EXPECT_EQ(options.pollInterval, std::chrono::milliseconds(25));
    EXPECT_EQ(options.terminateGrace, std::chrono::milliseconds(750));
}

TEST_F(ConfigTest, SupervisorOptionsFallBackOnInvalidSettings) {
    auto& config = Configs::Get();
    config.LoadFromString("[Runner]\nPollIntervalMs=0\nTerminateGraceMs=abc\n");
    auto options = ProcessSupervisor::optionsFrom(config);
    EXPECT_EQ(options.pollInterval, std::chrono::milliseconds(Configs::DEFAULT_POLL_INTERVAL_MS));
    EXPECT_EQ(options.terminateGrace, std::chrono::milliseconds(Configs::DEFAULT_TERMINATE_GRACE_MS));
}
