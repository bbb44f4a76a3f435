#include <gtest/gtest.h>

#include "io/block_accessor.hpp"
#include "testing.hpp"

#include <string>
#include <vector>

namespace fpack {
namespace {

std::span<const std::uint8_t> Bytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(BlockAccessorTest, OpenMissingReadOnlyFails) {
    testutil::TemporaryDirectory tmp;
    BlockAccessor acc;
    auto r = BlockAccessor::Open(tmp.File("missing.bin"), BlockAccessor::Mode::ReadOnly, acc);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
}

TEST(BlockAccessorTest, CreateReadWriteMakesEmptyFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("new.bin");
    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::CreateReadWrite, acc).is_ok());
    EXPECT_FALSE(acc.IsBlockDevice());
    EXPECT_TRUE(acc.Writable());
    EXPECT_EQ(acc.SizeBytes(), 0u);
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST(BlockAccessorTest, PositionalReadAndWrite) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("img.bin");
    testutil::WriteFile(path, std::string(4 * kSectorSize, '\0'));

    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::ReadWrite, acc).is_ok());
    EXPECT_EQ(acc.SizeSectors(), 4u);
    ASSERT_TRUE(acc.WriteAt(kSectorSize + 3, Bytes("marker")).is_ok());

    std::vector<std::uint8_t> sector;
    ASSERT_TRUE(acc.ReadSectors(1, 1, sector).is_ok());
    ASSERT_EQ(sector.size(), kSectorSize);
    EXPECT_EQ(std::string(sector.begin() + 3, sector.begin() + 9), "marker");
}

TEST(BlockAccessorTest, ReadPastEndIsShortRead) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("small.bin");
    testutil::WriteFile(path, std::string(100, 'x'));

    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::ReadOnly, acc).is_ok());
    std::vector<std::uint8_t> buf(200);
    auto r = acc.ReadAt(0, buf);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, EIO);
}

TEST(BlockAccessorTest, ReadOnlyRejectsWrites) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("ro.bin");
    testutil::WriteFile(path, std::string(16, 'x'));

    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::ReadOnly, acc).is_ok());
    auto r = acc.WriteAt(0, Bytes("y"));
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, EBADF);
}

TEST(BlockAccessorTest, TruncateResizesRegularFile) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("grow.bin");
    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::CreateReadWrite, acc).is_ok());
    ASSERT_TRUE(acc.Truncate(10 * kSectorSize).is_ok());
    EXPECT_EQ(acc.SizeSectors(), 10u);
    EXPECT_EQ(std::filesystem::file_size(path), 10 * kSectorSize);
}

TEST(RangeReaderTest, ReadsWindowAndStopsAtFileEnd) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("range.bin");
    testutil::WriteFile(path, "0123456789");

    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::ReadOnly, acc).is_ok());

    RangeReader inner(acc, 2, 4);
    EXPECT_EQ(testutil::ReadAll(inner), "2345");

    RangeReader tail(acc, 7, 100);
    EXPECT_EQ(testutil::ReadAll(tail), "789");
}

TEST(RangeWriterTest, RefusesToPassCapacity) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("cap.bin");
    testutil::WriteFile(path, std::string(16, '.'));

    BlockAccessor acc;
    ASSERT_TRUE(BlockAccessor::Open(path, BlockAccessor::Mode::ReadWrite, acc).is_ok());
    RangeWriter writer(acc, 4, 6);
    ASSERT_TRUE(writer.WriteAll(Bytes("abcd")).is_ok());
    auto r = writer.WriteAll(Bytes("efg"));
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOSPC);
    ASSERT_TRUE(writer.WriteAll(Bytes("ef")).is_ok());
    EXPECT_EQ(writer.BytesWritten(), 6u);
    EXPECT_EQ(testutil::ReadFile(path), "....abcdef......");
}

} // namespace
} // namespace fpack
