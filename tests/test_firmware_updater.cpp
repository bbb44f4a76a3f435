#include <gtest/gtest.h>

#include "image/firmware_updater.hpp"
#include "image/layout.hpp"
#include "testing.hpp"

#include <filesystem>
#include <sys/mount.h>
#include <sys/stat.h>

namespace fpack {
namespace {

namespace fs = std::filesystem;

class FirmwareUpdaterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        registry_ = std::make_shared<testutil::FakeTableRegistry>();
        mounts_ = std::make_shared<testutil::FakeMountOps>();
        release_ = tmp_.File("release.bin");
        rootfs_dir_ = tmp_.File("rootfs");
        scratch_dir_ = tmp_.File("scratch");
        fs::create_directories(rootfs_dir_ + "/usr/sbin");
        fs::create_directories(scratch_dir_);
        testutil::WriteImage(*registry_, release_, 32,
                             {{.number = layout::kRootfsA, .first_sector = 8, .sector_count = 8}});
        mounts_->Provide(release_, 8, rootfs_dir_);
    }

    testutil::TemporaryDirectory tmp_;
    std::shared_ptr<testutil::FakeTableRegistry> registry_;
    std::shared_ptr<testutil::FakeMountOps> mounts_;
    std::string release_;
    std::string rootfs_dir_;
    std::string scratch_dir_;
};

TEST_F(FirmwareUpdaterTest, CopiesUpdaterOutOfRootfs) {
    testutil::WriteFile(rootfs_dir_ + kFirmwareUpdaterPath, "#!/bin/sh\necho fw\n");
    PartitionTransferEngine engine(registry_->Opener());
    ScratchSet scratch(scratch_dir_);

    std::string path;
    auto r = FirmwareUpdaterExtractor(engine, mounts_, scratch).Extract(release_, path);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(path), "#!/bin/sh\necho fw\n");
    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);

    ASSERT_EQ(mounts_->mounts.size(), 1u);
    EXPECT_EQ(mounts_->mounts[0].fs_type, "ext2");
    EXPECT_NE(mounts_->mounts[0].flags & MS_RDONLY, 0u);
    EXPECT_TRUE(mounts_->attached.empty());
}

TEST_F(FirmwareUpdaterTest, MissingUpdaterFails) {
    PartitionTransferEngine engine(registry_->Opener());
    ScratchSet scratch(scratch_dir_);
    std::string path;
    auto r = FirmwareUpdaterExtractor(engine, mounts_, scratch).Extract(release_, path);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_TRUE(path.empty());
    EXPECT_EQ(mounts_->unmount_calls, 1);
}

TEST_F(FirmwareUpdaterTest, MountFailureIsWrapped) {
    mounts_->mount_result = Result::Fail(EPERM, "Operation not permitted");
    PartitionTransferEngine engine(registry_->Opener());
    ScratchSet scratch(scratch_dir_);
    std::string path;
    auto r = FirmwareUpdaterExtractor(engine, mounts_, scratch).Extract(release_, path);
    EXPECT_EQ(r.err, EPERM);
    EXPECT_NE(r.msg.find("rootfs"), std::string::npos);
}

} // namespace
} // namespace fpack
