#include <gtest/gtest.h>

#include "image/gpt_builder.hpp"
#include "testing.hpp"

#include <filesystem>

namespace fpack {
namespace {

const GptGeometry kSmall{.kernel_sectors = 4, .rootfs_sectors = 8, .oem_sectors = 2,
                         .efi_sectors = 2, .min_stateful_sectors = 4};

const PartitionSpec* FindSpec(const std::vector<PartitionSpec>& specs, int number) {
    for (const auto& s : specs)
        if (s.number == number) return &s;
    return nullptr;
}

TEST(GptLayoutTest, DefaultGeometryOnStandardDisk) {
    std::vector<PartitionSpec> specs;
    ASSERT_TRUE(GptTableBuilder::DefaultLayout(layout::kDefaultDiskSectors, GptGeometry{}, specs).is_ok());
    ASSERT_EQ(specs.size(), 12u);

    // Placeholders occupy one sector each from the first usable sector.
    const int placeholder_order[] = {11, 6, 7, 9, 10};
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(specs[static_cast<size_t>(i)].number, placeholder_order[i]);
        EXPECT_EQ(specs[static_cast<size_t>(i)].first_sector, 64u + static_cast<unsigned>(i));
        EXPECT_EQ(specs[static_cast<size_t>(i)].sector_count, 1u);
    }

    const auto* kern_a = FindSpec(specs, 2);
    ASSERT_NE(kern_a, nullptr);
    EXPECT_EQ(kern_a->first_sector, 69u);
    EXPECT_EQ(kern_a->sector_count, layout::kKernelSectors);
    EXPECT_EQ(kern_a->type, PartitionType::Kernel);
    EXPECT_EQ(kern_a->label, "KERN-A");

    const auto* state = FindSpec(specs, 1);
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->label, "STATE");
    EXPECT_EQ(state->first_sector + state->sector_count, layout::kDefaultDiskSectors - 33);

    const auto* efi = FindSpec(specs, 12);
    ASSERT_NE(efi, nullptr);
    EXPECT_EQ(efi->type, PartitionType::Efi);
}

TEST(GptLayoutTest, PartitionsAreContiguousAndDisjoint) {
    std::vector<PartitionSpec> specs;
    ASSERT_TRUE(GptTableBuilder::DefaultLayout(200, kSmall, specs).is_ok());
    std::uint64_t next = 64;
    for (const auto& s : specs) {
        EXPECT_EQ(s.first_sector, next) << "#" << s.number;
        next = s.first_sector + s.sector_count;
    }
    EXPECT_EQ(next, 200u - 33);
    EXPECT_EQ(specs.back().number, 1);
    EXPECT_EQ(specs.back().sector_count, 70u);
}

TEST(GptLayoutTest, TooSmallImageIsRejected) {
    std::vector<PartitionSpec> specs;
    EXPECT_TRUE(GptTableBuilder::DefaultLayout(134, kSmall, specs).is_ok());
    auto r = GptTableBuilder::DefaultLayout(133, kSmall, specs);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOSPC);
    EXPECT_TRUE(specs.empty());
    EXPECT_EQ(GptTableBuilder::DefaultLayout(90, kSmall, specs).err, ENOSPC);
}

class GptBuilderTest : public ::testing::Test {
  protected:
    void SetUp() override { registry_ = std::make_shared<testutil::FakeTableRegistry>(); }

    GptTableBuilder Builder() const { return GptTableBuilder(registry_->Opener(), kSmall); }

    testutil::TemporaryDirectory tmp_;
    std::shared_ptr<testutil::FakeTableRegistry> registry_;
};

TEST_F(GptBuilderTest, PrepareTargetCreatesSizedFile) {
    const std::string target = tmp_.File("disk.bin");
    std::uint64_t sectors = 0;
    ASSERT_TRUE(Builder().PrepareTarget(target, 200, false, sectors).is_ok());
    EXPECT_EQ(sectors, 200u);
    EXPECT_EQ(std::filesystem::file_size(target), 200u * 512);
}

TEST_F(GptBuilderTest, PrepareTargetZeroesExistingFile) {
    const std::string target = tmp_.File("disk.bin");
    testutil::WriteFile(target, std::string(200 * 512, 'x'));
    std::uint64_t sectors = 0;
    ASSERT_TRUE(Builder().PrepareTarget(target, 200, false, sectors).is_ok());
    EXPECT_EQ(testutil::ReadFile(target), std::string(200 * 512, '\0'));
}

TEST_F(GptBuilderTest, PreserveKeepsMatchingFile) {
    const std::string target = tmp_.File("disk.bin");
    testutil::WriteFile(target, std::string(200 * 512, 'x'));
    std::uint64_t sectors = 0;
    ASSERT_TRUE(Builder().PrepareTarget(target, 200, true, sectors).is_ok());
    EXPECT_EQ(testutil::ReadRange(target, 0, 4), "xxxx");
}

TEST_F(GptBuilderTest, PreserveRecreatesMismatchedFile) {
    const std::string target = tmp_.File("disk.bin");
    testutil::WriteFile(target, std::string(100 * 512, 'x'));
    std::uint64_t sectors = 0;
    ASSERT_TRUE(Builder().PrepareTarget(target, 200, true, sectors).is_ok());
    EXPECT_EQ(std::filesystem::file_size(target), 200u * 512);
    EXPECT_EQ(testutil::ReadRange(target, 0, 4), std::string(4, '\0'));
}

TEST_F(GptBuilderTest, InstallWritesLayoutAndBootCode) {
    const std::string target = tmp_.File("disk.bin");
    const std::string pmbr = tmp_.File("pmbr.bin");
    testutil::WriteFile(pmbr, testutil::Pattern(512, 'p'));
    auto state = registry_->State(target);
    state->parts[3] = PartitionExtent{.number = 3, .first_sector = 1, .sector_count = 1};

    ASSERT_TRUE(Builder().Install(target, 200, pmbr).is_ok());
    EXPECT_EQ(state->create_calls, 1);
    EXPECT_EQ(state->parts.size(), 12u);
    EXPECT_EQ(state->parts[3].first_sector, 81u);
    EXPECT_EQ(state->specs[8].label, "OEM");
    EXPECT_EQ(state->boot_code, testutil::Pattern(512, 'p'));
}

TEST_F(GptBuilderTest, ActivateSetsAttributes) {
    const std::string target = tmp_.File("disk.bin");
    auto state = registry_->State(target);
    state->parts[2] = PartitionExtent{.number = 2, .first_sector = 69, .sector_count = 4};

    ASSERT_TRUE(Builder().Activate(target, 2, {.priority = 1, .tries = 0, .successful = true}).is_ok());
    EXPECT_EQ(state->attrs[2].priority, 1);
    EXPECT_TRUE(state->attrs[2].successful);
}

TEST_F(GptBuilderTest, ExtractBootCodeCopiesFirstSector) {
    const std::string source = tmp_.File("release.bin");
    const std::string out = tmp_.File("pmbr.bin");
    testutil::WriteFile(source, testutil::Pattern(4 * 512, 'm'));
    ASSERT_TRUE(GptTableBuilder::ExtractBootCode(source, out).is_ok());
    EXPECT_EQ(testutil::ReadFile(out), testutil::Pattern(512, 'm'));
}

} // namespace
} // namespace fpack
