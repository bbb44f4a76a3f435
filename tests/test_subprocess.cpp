#include <gtest/gtest.h>

#include "system/subprocess.hpp"

namespace fpack {
namespace {

TEST(SubprocessTest, CapturesStdout) {
    PosixCommandRunner runner;
    std::string out;
    auto r = runner.Run({"echo", "hi"}, &out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out, "hi\n");
}

TEST(SubprocessTest, NonZeroExitIsReportedAsCode) {
    PosixCommandRunner runner;
    auto r = runner.Run({"sh", "-c", "exit 3"}, nullptr);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, 3);
}

TEST(SubprocessTest, MissingProgramFails) {
    PosixCommandRunner runner;
    auto r = runner.Run({"fpack-no-such-program-xyz"}, nullptr);
    EXPECT_FALSE(r.is_ok());
}

TEST(SubprocessTest, EmptyArgvFails) {
    PosixCommandRunner runner;
    EXPECT_FALSE(runner.Run({}, nullptr).is_ok());
}

TEST(SubprocessTest, HasCommandLooksUpPath) {
    EXPECT_TRUE(HasCommand("sh"));
    EXPECT_FALSE(HasCommand("fpack-no-such-program-xyz"));
}

TEST(SubprocessTest, JoinArgvSeparatesWithSpaces) {
    EXPECT_EQ(JoinArgv({"cgpt", "show", "-q", "disk.bin"}), "cgpt show -q disk.bin");
}

} // namespace
} // namespace fpack
