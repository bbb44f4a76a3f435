#include <gtest/gtest.h>

#include "image/kernel_resolver.hpp"
#include "image/layout.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fpack {
namespace {

using namespace keyblock;

constexpr std::uint64_t kStatefulFirst = 20;

class KernelResolverTest : public ::testing::Test {
  protected:
    void SetUp() override {
        registry_ = std::make_shared<testutil::FakeTableRegistry>();
        mounts_ = std::make_shared<testutil::FakeMountOps>();
        image_ = tmp_.File("image.bin");
        stateful_dir_ = tmp_.File("stateful");
        scratch_dir_ = tmp_.File("scratch");
        std::filesystem::create_directories(stateful_dir_);
        std::filesystem::create_directories(scratch_dir_);
        mounts_->Provide(image_, kStatefulFirst, stateful_dir_);
    }

    void MakeImage(const std::string& kern_a, const std::string& kern_b) {
        testutil::WriteImage(*registry_, image_, 32,
                             {{.number = layout::kKernelA, .first_sector = 4, .sector_count = 4, .data = kern_a},
                              {.number = layout::kKernelB, .first_sector = 8, .sector_count = 4, .data = kern_b},
                              {.number = layout::kStateful, .first_sector = kStatefulFirst, .sector_count = 4}});
    }

    Result Resolve(ResolvedKernel& out) {
        PartitionTransferEngine engine(registry_->Opener());
        ScratchSet scratch(scratch_dir_);
        KernelResolver resolver(engine, mounts_, scratch);
        auto r = resolver.Resolve(image_, out);
        if (r.is_ok() && out.patched_path) patched_ = testutil::ReadFile(*out.patched_path);
        return r;
    }

    testutil::TemporaryDirectory tmp_;
    std::shared_ptr<testutil::FakeTableRegistry> registry_;
    std::shared_ptr<testutil::FakeMountOps> mounts_;
    std::string image_;
    std::string stateful_dir_;
    std::string scratch_dir_;
    std::string patched_;
};

TEST_F(KernelResolverTest, SsdNeedsNoPatch) {
    MakeImage(testutil::MakeKernelBlob(kFlagRecovery0, "root=/dev/sda3", 2048), "");
    ResolvedKernel out;
    ASSERT_TRUE(Resolve(out).is_ok());
    EXPECT_EQ(out.variant, KernelVariant::Ssd);
    EXPECT_FALSE(out.patched_path.has_value());
    EXPECT_TRUE(mounts_->mounts.empty());
}

TEST_F(KernelResolverTest, UsbKernelGetsBootBlockOverlay) {
    const std::string kernel = testutil::MakeKernelBlob(kFlagRecovery1 | kFlagDeveloper0, "root=/dev/sdb3", 2048);
    MakeImage(kernel, "");
    testutil::WriteFile(stateful_dir_ + "/" + kBootBlockName, "VBLOCK-HD");

    ResolvedKernel out;
    auto r = Resolve(out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.variant, KernelVariant::Usb);
    ASSERT_TRUE(out.patched_path.has_value());
    ASSERT_EQ(patched_.size(), 4u * 512);
    EXPECT_EQ(patched_.substr(0, 9), "VBLOCK-HD");
    EXPECT_EQ(patched_.substr(9, 2048 - 9), kernel.substr(9));

    ASSERT_EQ(mounts_->mounts.size(), 1u);
    EXPECT_EQ(mounts_->mounts[0].offset, kStatefulFirst * 512);
    EXPECT_EQ(mounts_->mounts[0].fs_type, "ext4");
    EXPECT_NE(mounts_->mounts[0].flags & MS_RDONLY, 0u);
}

TEST_F(KernelResolverTest, RecoveryUsesPartitionFourAsBase) {
    const std::string kern_a = testutil::MakeKernelBlob(
        kFlagRecovery1 | kFlagDeveloper0, "root=/dev/dm-0 cros_recovery kern_b_hash=ab", 2048);
    const std::string kern_b = testutil::Pattern(4 * 512, 'B');
    MakeImage(kern_a, kern_b);
    testutil::WriteFile(stateful_dir_ + "/" + kBootBlockName, "VB");

    ResolvedKernel out;
    auto r = Resolve(out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.variant, KernelVariant::Recovery);
    EXPECT_EQ(patched_, "VB" + kern_b.substr(2));
}

TEST_F(KernelResolverTest, MissingBootBlockFails) {
    MakeImage(testutil::MakeKernelBlob(kFlagRecovery1 | kFlagDeveloper0, "root=/dev/sdb3", 2048), "");
    ResolvedKernel out;
    auto r = Resolve(out);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_EQ(mounts_->unmount_calls, 1);
    EXPECT_EQ(mounts_->detach_calls, 1);
}

TEST(OverlayFileHeadTest, KeepsTargetLength) {
    testutil::TemporaryDirectory tmp;
    const std::string patch = tmp.File("patch");
    const std::string target = tmp.File("target");
    testutil::WriteFile(patch, "abc");
    testutil::WriteFile(target, "0123456789");
    ASSERT_TRUE(OverlayFileHead(patch, target).is_ok());
    EXPECT_EQ(testutil::ReadFile(target), "abc3456789");
}

TEST(OverlayFileHeadTest, RejectsEmptyAndOversizedPatch) {
    testutil::TemporaryDirectory tmp;
    const std::string patch = tmp.File("patch");
    const std::string target = tmp.File("target");
    testutil::WriteFile(target, "0123");

    testutil::WriteFile(patch, "");
    EXPECT_EQ(OverlayFileHead(patch, target).err, ENOENT);

    testutil::WriteFile(patch, "too long patch");
    EXPECT_EQ(OverlayFileHead(patch, target).err, ENOSPC);
    EXPECT_EQ(testutil::ReadFile(target), "0123");
}

} // namespace
} // namespace fpack
