#include <gtest/gtest.h>

#include "image/layout.hpp"
#include "pack/disk_image_builder.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fpack {
namespace {

namespace fs = std::filesystem;

const GptGeometry kSmall{.kernel_sectors = 4, .rootfs_sectors = 8, .oem_sectors = 2,
                         .efi_sectors = 2, .min_stateful_sectors = 4};
constexpr std::uint64_t kTargetSectors = 200;
// Where kSmall places the partitions on a 200 sector target.
constexpr std::uint64_t kKernAFirst = 69;
constexpr std::uint64_t kKernBFirst = 73;
constexpr std::uint64_t kOemFirst = 77;
constexpr std::uint64_t kEfiFirst = 79;
constexpr std::uint64_t kRootAFirst = 81;
constexpr std::uint64_t kRootBFirst = 89;
constexpr std::uint64_t kStateFirst = 97;

void SetBootSector(const std::string& image, const std::string& code) {
    std::string data = testutil::ReadFile(image);
    std::copy(code.begin(), code.end(), data.begin());
    testutil::WriteFile(image, data);
}

class DiskImageBuilderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        registry_ = std::make_shared<testutil::FakeTableRegistry>();
        mounts_ = std::make_shared<testutil::FakeMountOps>();
        runner_ = std::make_shared<testutil::FakeCommandRunner>();
        release_ = tmp_.File("release.bin");
        factory_ = tmp_.File("factory.bin");
        target_ = tmp_.File("disk.bin");
        esp_dir_ = tmp_.File("esp");
        scratch_dir_ = tmp_.File("scratch");
        fs::create_directories(esp_dir_);
        fs::create_directories(scratch_dir_);

        testutil::WriteImage(*registry_, release_, 48,
                             {{.number = layout::kKernelA, .first_sector = 4, .sector_count = 4, .data = "REL-KERNEL"},
                              {.number = layout::kRootfsA, .first_sector = 8, .sector_count = 8, .data = "REL-ROOTFS"},
                              {.number = layout::kOem, .first_sector = 20, .sector_count = 2, .data = "REL-OEM"}});
        SetBootSector(release_, testutil::Pattern(512, 'b'));
        testutil::WriteImage(*registry_, factory_, 48,
                             {{.number = layout::kStateful, .first_sector = 30, .sector_count = 4, .data = "FAC-STATE"},
                              {.number = layout::kKernelA, .first_sector = 4, .sector_count = 4, .data = "FAC-KERNEL"},
                              {.number = layout::kRootfsA, .first_sector = 8, .sector_count = 6, .data = "FAC-ROOTFS"},
                              {.number = layout::kEfi, .first_sector = 20, .sector_count = 2, .data = "FAC-EFI"}});
        mounts_->Provide(target_, kEfiFirst, esp_dir_);
    }

    DiskImageJob Job() const {
        return DiskImageJob{.release = release_, .factory = factory_, .target = target_,
                            .sectors = kTargetSectors};
    }

    Result Build(const DiskImageJob& job) {
        PartitionTransferEngine engine(registry_->Opener());
        GptTableBuilder gpt(registry_->Opener(), kSmall);
        HwidUpdater hwid(engine, runner_, mounts_);
        ScratchSet scratch(scratch_dir_);
        return DiskImageBuilder(engine, gpt, hwid, mounts_, scratch).Build(job);
    }

    std::string At(std::uint64_t sector, size_t len) const {
        return testutil::ReadRange(target_, sector * 512, len);
    }

    testutil::TemporaryDirectory tmp_;
    std::shared_ptr<testutil::FakeTableRegistry> registry_;
    std::shared_ptr<testutil::FakeMountOps> mounts_;
    std::shared_ptr<testutil::FakeCommandRunner> runner_;
    std::string release_;
    std::string factory_;
    std::string target_;
    std::string esp_dir_;
    std::string scratch_dir_;
};

TEST_F(DiskImageBuilderTest, ComposesFactoryAndReleaseSlots) {
    auto r = Build(Job());
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(fs::file_size(target_), kTargetSectors * 512);
    EXPECT_EQ(At(kKernAFirst, 10), "FAC-KERNEL");
    EXPECT_EQ(At(kRootAFirst, 10), "FAC-ROOTFS");
    EXPECT_EQ(At(kKernBFirst, 10), "REL-KERNEL");
    EXPECT_EQ(At(kRootBFirst, 10), "REL-ROOTFS");
    EXPECT_EQ(At(kOemFirst, 7), "REL-OEM");
    EXPECT_EQ(At(kEfiFirst, 7), "FAC-EFI");
    EXPECT_EQ(At(kStateFirst, 9), "FAC-STATE");

    auto state = registry_->State(target_);
    EXPECT_EQ(state->boot_code, testutil::Pattern(512, 'b'));
    EXPECT_EQ(state->parts[layout::kRootfsA].sector_count, 6u);
    EXPECT_EQ(state->parts[layout::kStateful].sector_count, 4u);
    EXPECT_EQ(state->attrs[layout::kKernelA].priority, 1);
    EXPECT_TRUE(state->attrs[layout::kKernelA].successful);
    EXPECT_TRUE(runner_->calls.empty());
}

TEST_F(DiskImageBuilderTest, EspIsMountedWritableAndReleased) {
    ASSERT_TRUE(Build(Job()).is_ok());
    ASSERT_EQ(mounts_->mounts.size(), 1u);
    EXPECT_EQ(mounts_->mounts[0].offset, kEfiFirst * 512);
    EXPECT_EQ(mounts_->mounts[0].fs_type, "vfat");
    EXPECT_EQ(mounts_->mounts[0].flags & MS_RDONLY, 0u);
    EXPECT_EQ(mounts_->unmount_calls, 1);
    EXPECT_TRUE(mounts_->attached.empty());
}

TEST_F(DiskImageBuilderTest, PatchedReleaseKernelIsInstalled) {
    const std::string kernel = tmp_.File("kernel.bin");
    testutil::WriteFile(kernel, "PATCHED");
    DiskImageJob job = Job();
    job.release_kernel = kernel;
    ASSERT_TRUE(Build(job).is_ok());
    EXPECT_EQ(At(kKernBFirst, 7), "PATCHED");
}

TEST_F(DiskImageBuilderTest, HwidUpdaterRunsOnStatefulLoop) {
    DiskImageJob job = Job();
    job.hwid_updater = tmp_.File("hwid.sh");
    ASSERT_TRUE(Build(job).is_ok());

    ASSERT_EQ(runner_->calls.size(), 1u);
    EXPECT_EQ(runner_->calls[0][0], "sh");
    EXPECT_EQ(runner_->calls[0][1], *job.hwid_updater);
    ASSERT_FALSE(mounts_->attach_log.empty());
    EXPECT_EQ(mounts_->attach_log[0].offset, kStateFirst * 512);
    EXPECT_FALSE(mounts_->attach_log[0].read_only);
}

TEST_F(DiskImageBuilderTest, HwidFailureStopsBuild) {
    runner_->handler = [](const std::vector<std::string>&, std::string*) {
        return Result::Fail(3, "exit 3");
    };
    DiskImageJob job = Job();
    job.hwid_updater = tmp_.File("hwid.sh");
    auto r = Build(job);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, 3);
    EXPECT_NE(r.msg.find("Failed to update HWID"), std::string::npos);
    EXPECT_TRUE(mounts_->attached.empty());
}

TEST_F(DiskImageBuilderTest, LegacyBootConfigPointsAtInternalDisk) {
    fs::create_directories(esp_dir_ + "/syslinux");
    testutil::WriteFile(esp_dir_ + "/syslinux/default.cfg",
                        "DEFAULT chromeos-usb.A\nLABEL chromeos-vusb.A\n");
    testutil::WriteFile(esp_dir_ + "/syslinux/root.A.cfg", "append root=HDROOTA rootwait\n");

    ASSERT_TRUE(Build(Job()).is_ok());
    EXPECT_EQ(testutil::ReadFile(esp_dir_ + "/syslinux/default.cfg"),
              "DEFAULT chromeos-hd.A\nLABEL chromeos-vhd.A\n");
    EXPECT_EQ(testutil::ReadFile(esp_dir_ + "/syslinux/root.A.cfg"), "append root=/dev/sda3 rootwait\n");
}

TEST_F(DiskImageBuilderTest, PatchLegacyBootConfigToleratesMissingFiles) {
    EXPECT_TRUE(DiskImageBuilder::PatchLegacyBootConfig(esp_dir_).is_ok());
    fs::create_directories(esp_dir_ + "/syslinux");
    testutil::WriteFile(esp_dir_ + "/syslinux/root.A.cfg", "root=HDROOTA");
    EXPECT_TRUE(DiskImageBuilder::PatchLegacyBootConfig(esp_dir_).is_ok());
    EXPECT_EQ(testutil::ReadFile(esp_dir_ + "/syslinux/root.A.cfg"), "root=/dev/sda3");
    EXPECT_FALSE(fs::exists(esp_dir_ + "/syslinux/default.cfg"));
}

TEST_F(DiskImageBuilderTest, DefaultConfigEditsFirstMatchPerLine) {
    fs::create_directories(esp_dir_ + "/syslinux");
    testutil::WriteFile(esp_dir_ + "/syslinux/default.cfg",
                        "menu chromeos-usb.A chromeos-usb.A\nLABEL chromeos-vusb.A\nchromeos-usb.A");
    testutil::WriteFile(esp_dir_ + "/syslinux/root.A.cfg", "root=HDROOTA HDROOTA\nHDROOTA\n");

    ASSERT_TRUE(DiskImageBuilder::PatchLegacyBootConfig(esp_dir_).is_ok());
    EXPECT_EQ(testutil::ReadFile(esp_dir_ + "/syslinux/default.cfg"),
              "menu chromeos-hd.A chromeos-usb.A\nLABEL chromeos-vhd.A\nchromeos-hd.A");
    EXPECT_EQ(testutil::ReadFile(esp_dir_ + "/syslinux/root.A.cfg"), "root=/dev/sda3 /dev/sda3\n/dev/sda3\n");
}

TEST_F(DiskImageBuilderTest, OversizedReleaseRootfsIsRejected) {
    registry_->State(release_)->parts[layout::kRootfsA].sector_count = 12;
    auto r = Build(Job());
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOSPC);
}

TEST_F(DiskImageBuilderTest, TargetTooSmallForLayout) {
    DiskImageJob job = Job();
    job.sectors = 120;
    auto r = Build(job);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOSPC);
}

} // namespace
} // namespace fpack
