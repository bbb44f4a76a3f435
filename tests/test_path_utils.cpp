#include <gtest/gtest.h>

#include "util/path_utils.hpp"

TEST(PathUtilsTest, IsDevPath) {
    EXPECT_TRUE(fpack::IsDevPath("/dev/sda"));
    EXPECT_TRUE(fpack::IsDevPath("/dev/loop0"));
    EXPECT_FALSE(fpack::IsDevPath("/device/sda"));
    EXPECT_FALSE(fpack::IsDevPath("dev/sda"));
    EXPECT_FALSE(fpack::IsDevPath("/tmp/dev/sda"));
}

TEST(PathUtilsTest, JoinPathUsesSingleSeparator) {
    EXPECT_EQ(fpack::JoinPath("/mnt/x", "usr/sbin/tool"), "/mnt/x/usr/sbin/tool");
    EXPECT_EQ(fpack::JoinPath("/mnt/x/", "/usr/sbin/tool"), "/mnt/x/usr/sbin/tool");
    EXPECT_EQ(fpack::JoinPath("", "a"), "a");
}

TEST(PathUtilsTest, ReplaceAllCountsReplacements) {
    std::string s = "root=HDROOTA ro HDROOTA";
    EXPECT_EQ(fpack::ReplaceAll(s, "HDROOTA", "/dev/sda3"), 2u);
    EXPECT_EQ(s, "root=/dev/sda3 ro /dev/sda3");

    std::string unchanged = "abc";
    EXPECT_EQ(fpack::ReplaceAll(unchanged, "x", "y"), 0u);
    EXPECT_EQ(fpack::ReplaceAll(unchanged, "", "y"), 0u);
    EXPECT_EQ(unchanged, "abc");
}
