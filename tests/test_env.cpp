#include <gtest/gtest.h>
#include "core/util/Env.hpp"

using namespace pyrunner;

TEST(EnvTest, OverlayReplacesAndAdds) {
    Env::Map base{{"A", "1"}, {"B", "2"}};
    auto result = Env::overlay(base, {{"B", "20"}, {"C", "3"}});
    EXPECT_EQ(result, (Env::Map{{"A", "1"}, {"B", "20"}, {"C", "3"}}));
    EXPECT_EQ(base.at("B"), "2");
}

TEST(EnvTest, ToEntriesFormatsKeyValue) {
    auto entries = Env::toEntries({{"A", "1"}, {"EMPTY", ""}});
    EXPECT_EQ(entries, (std::vector<std::string>{"A=1", "EMPTY="}));
}

TEST(EnvTest, PathListJoinAndSplit) {
    EXPECT_EQ(Env::joinPathList({"/a", "/b"}), "/a:/b");
    EXPECT_EQ(Env::joinPathList({}), "");
    EXPECT_EQ(Env::splitPathList("/a::/b:"), (std::vector<std::string>{"/a", "/b"}));
}

TEST(EnvTest, PrependKeepsOrderAndExistingValue) {
    EXPECT_EQ(Env::prependPathList({"/x", "/y"}, "/old"), "/x:/y:/old");
    EXPECT_EQ(Env::prependPathList({"/x"}, ""), "/x");
    EXPECT_EQ(Env::prependPathList({}, "/old"), "/old");
}

TEST(EnvTest, WhichFindsShell) {
    std::string sh = Env::which("sh");
    ASSERT_FALSE(sh.empty());
    EXPECT_TRUE(Env::isExecutable(sh));
    EXPECT_EQ(Env::which("/bin/sh"), "/bin/sh");
    EXPECT_EQ(Env::which("pyrunner-no-such-command"), "");
}

TEST(EnvTest, ExpandTilde) {
    EXPECT_EQ(Env::expandTilde("~/x"), Env::home() + "/x");
    EXPECT_EQ(Env::expandTilde("~user/x"), "~user/x");
    EXPECT_EQ(Env::expandTilde("/abs"), "/abs");
}

TEST(EnvTest, FilesystemPredicates) {
    EXPECT_TRUE(Env::isDirectory("/"));
    EXPECT_FALSE(Env::isFile("/"));
    EXPECT_FALSE(Env::pathExists(""));
    EXPECT_FALSE(Env::pathExists("/pyrunner/does/not/exist"));
}
