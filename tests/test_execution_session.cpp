#include <gtest/gtest.h>
#include "core/process/ExecutionSession.hpp"
#include "TestSupport.hpp"

using namespace pyrunner;

class SessionFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        script = dir.file("hello.py", "print('hello')\n");
        request.interpreterPath = "/bin/sh";
        request.scriptPath = script;
    }

    test::TempDir dir;
    std::string script;
    SessionRequest request;
};

TEST_F(SessionFactoryTest, ValidRequestBuildsSession) {
    request.extraSearchPaths = {" /lib/a ", "", "/lib/b"};
    request.timeoutSeconds = 7;
    request.environmentText = "A=1; B = two ";
    auto session = SessionFactory::create(request);

    EXPECT_EQ(session.interpreterPath(), "/bin/sh");
    EXPECT_EQ(session.scriptPath(), script);
    EXPECT_EQ(session.extraSearchPaths(), (std::vector<std::string>{"/lib/a", "/lib/b"}));
    EXPECT_EQ(session.timeoutSeconds(), 7);
    EXPECT_EQ(session.extraEnvironment(), (std::map<std::string, std::string>{{"A", "1"}, {"B", "two"}}));
    EXPECT_TRUE(session.forceUtf8());
    EXPECT_EQ(session.commandLine(), (std::vector<std::string>{"/bin/sh", "-u", script}));
}

TEST_F(SessionFactoryTest, EnvironmentTextOverridesExtraEnvironment) {
    request.extraEnvironment = {{"A", "base"}, {"KEEP", "yes"}};
    request.environmentText = "A=text";
    auto session = SessionFactory::create(request);
    EXPECT_EQ(session.extraEnvironment().at("A"), "text");
    EXPECT_EQ(session.extraEnvironment().at("KEEP"), "yes");
}

TEST_F(SessionFactoryTest, MissingFieldsAreRejected) {
    SessionRequest empty;
    EXPECT_THROW(SessionFactory::create(empty), ValidationError);

    request.scriptPath.clear();
    EXPECT_THROW(SessionFactory::create(request), ValidationError);
}

TEST_F(SessionFactoryTest, NonexistentPathsAreRejected) {
    request.interpreterPath = "/pyrunner/no/python";
    EXPECT_THROW(SessionFactory::create(request), ValidationError);

    request.interpreterPath = "/bin/sh";
    request.scriptPath = (dir.path / "missing.py").string();
    EXPECT_THROW(SessionFactory::create(request), ValidationError);
}

TEST_F(SessionFactoryTest, NegativeTimeoutAndBadWorkingDirectoryAreRejected) {
    request.timeoutSeconds = -1;
    EXPECT_THROW(SessionFactory::create(request), ValidationError);

    request.timeoutSeconds = 0;
    request.workingDirectory = (dir.path / "nowhere").string();
    EXPECT_THROW(SessionFactory::create(request), ValidationError);
}

TEST_F(SessionFactoryTest, MalformedEnvironmentTextIsRejected) {
    request.environmentText = "A=1;JUSTAKEY";
    EXPECT_THROW(SessionFactory::create(request), ValidationError);

    request.environmentText = "=value";
    EXPECT_THROW(SessionFactory::create(request), ValidationError);
}

TEST(ParseEnvironmentTextTest, SplitsOnFirstEquals) {
    auto env = SessionFactory::parseEnvironmentText("URL=http://x/?a=b;;  ;EMPTY=");
    EXPECT_EQ(env, (std::map<std::string, std::string>{{"URL", "http://x/?a=b"}, {"EMPTY", ""}}));
}

TEST(ParseEnvironmentTextTest, BlankTextIsEmpty) {
    EXPECT_TRUE(SessionFactory::parseEnvironmentText("").empty());
    EXPECT_TRUE(SessionFactory::parseEnvironmentText(" ; ").empty());
}

TEST(ResolveInterpreterTest, LooksUpBareNamesOnPath) {
    std::string sh = SessionFactory::resolveInterpreter("sh");
    EXPECT_NE(sh, "sh");
    EXPECT_EQ(sh.back(), 'h');
    EXPECT_EQ(SessionFactory::resolveInterpreter("/usr/bin/python3"), "/usr/bin/python3");
    EXPECT_EQ(SessionFactory::resolveInterpreter("pyrunner-no-such-python"), "pyrunner-no-such-python");
}
