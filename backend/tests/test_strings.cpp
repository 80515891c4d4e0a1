#include <gtest/gtest.h>
#include "utils/Strings.hpp"

TEST(SplitTagsLineTest, TrimsAndDropsEmptyNames) {
    EXPECT_EQ(splitTagsLine(" enUS, Windows ,,\tx86_64 "),
        (std::vector<std::string>{ "enUS", "Windows", "x86_64" }));
}

TEST(SplitTagsLineTest, BlankLineYieldsNothing) {
    EXPECT_TRUE(splitTagsLine("").empty());
    EXPECT_TRUE(splitTagsLine(" , \t ,").empty());
}

TEST(SplitTagsLineTest, KeepsInnerSpaces) {
    EXPECT_EQ(splitTagsLine("a b, c"), (std::vector<std::string>{ "a b", "c" }));
}
