#include <gtest/gtest.h>
#include "utils/Utf8.hpp"

using namespace pyrunner;

namespace {
const std::string R(utf8::kReplacement);
}

TEST(Utf8Test, ValidTextPassesThrough) {
    std::string text = "h\xC3\xA9llo \xE4\xB8\xAD\xE6\x96\x87 \xF0\x9F\x98\x80";
    EXPECT_EQ(utf8::sanitize(text), text);
}

TEST(Utf8Test, InvalidByteIsReplaced) {
    EXPECT_EQ(utf8::sanitize("a\xFF" "b"), "a" + R + "b");
}

TEST(Utf8Test, TruncatedSequenceIsOneReplacement) {
    EXPECT_EQ(utf8::sanitize("a\xE2\x82"), "a" + R);
}

TEST(Utf8Test, OverlongAndSurrogateFormsAreRejected) {
    EXPECT_EQ(utf8::sanitize("\xC0\xAF"), R + R);
    EXPECT_EQ(utf8::sanitize("\xED\xA0\x80"), R + R + R);
    EXPECT_EQ(utf8::sanitize("\xF4\x90\x80\x80"), R + R + R + R);
}

TEST(Utf8Test, DecodeReportsCodePointAndLength) {
    const uint8_t euro[] = {0xE2, 0x82, 0xAC};
    uint32_t cp = 0;
    size_t read = 0;
    ASSERT_TRUE(utf8::decode(euro, sizeof(euro), &cp, &read));
    EXPECT_EQ(cp, 0x20ACu);
    EXPECT_EQ(read, 3u);
}

TEST(Utf8Test, TrimRightStripsTrailingWhitespaceOnly) {
    EXPECT_EQ(utf8::trimRight("  indented\t \r\n"), "  indented");
    EXPECT_EQ(utf8::trimRight(" \t\r\n"), "");
    EXPECT_EQ(utf8::trimRight(""), "");
}
