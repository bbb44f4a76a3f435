// gpt_builder.cpp - Target image preparation and GPT installation.

#include "image/gpt_builder.hpp"

#include "io/block_accessor.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace fpack {

namespace {

using namespace layout;

struct SlotPlan {
    int number;
    PartitionType type;
    const char* label;
};

} // namespace

GptTableBuilder::GptTableBuilder(PartitionTableOpener open_table, GptGeometry geometry)
    : open_table_(std::move(open_table)), geometry_(geometry) {}

Result GptTableBuilder::DefaultLayout(std::uint64_t total_sectors, const GptGeometry& g,
                                      std::vector<PartitionSpec>& out) {
    out.clear();
    if (total_sectors <= kFirstUsableSector + kGptReservedSectors) {
        return Result::Fail(ENOSPC, "Image of " + std::to_string(total_sectors) +
                                        " sectors is too small for a partition table");
    }
    const std::uint64_t last_usable = total_sectors - kGptReservedSectors;

    std::uint64_t next = kFirstUsableSector;
    auto place = [&](int number, std::uint64_t count, PartitionType type, const char* label) {
        out.push_back(PartitionSpec{.number = number, .first_sector = next, .sector_count = count,
                                    .type = type, .label = label});
        next += count;
    };

    // Placeholders first so that the growing partitions come last.
    const SlotPlan placeholders[] = {
        {kFirmware, PartitionType::Firmware, "RWFW"},
        {kKernelC, PartitionType::Kernel, "KERN-C"},
        {kRootfsC, PartitionType::Rootfs, "ROOT-C"},
        {kReserved9, PartitionType::Reserved, "reserved"},
        {kReserved10, PartitionType::Reserved, "reserved"},
    };
    for (const auto& slot : placeholders) place(slot.number, 1, slot.type, slot.label);

    place(kKernelA, g.kernel_sectors, PartitionType::Kernel, "KERN-A");
    place(kKernelB, g.kernel_sectors, PartitionType::Kernel, "KERN-B");
    place(kOem, g.oem_sectors, PartitionType::Data, "OEM");
    place(kEfi, g.efi_sectors, PartitionType::Efi, "EFI-SYSTEM");
    place(kRootfsA, g.rootfs_sectors, PartitionType::Rootfs, "ROOT-A");
    place(kRootfsB, g.rootfs_sectors, PartitionType::Rootfs, "ROOT-B");

    if (next + g.min_stateful_sectors > last_usable) {
        out.clear();
        return Result::Fail(ENOSPC, "Image of " + std::to_string(total_sectors) +
                                        " sectors is too small for the default layout");
    }
    place(kStateful, last_usable - next, PartitionType::Data, "STATE");
    return Result::Ok();
}

Result GptTableBuilder::PrepareTarget(const std::string& target, std::uint64_t sectors, bool preserve,
                                      std::uint64_t& out_sectors) const {
    const std::uint64_t want_bytes = sectors * kSectorSize;

    if (BlockAccessor::IsBlockDevicePath(target)) {
        BlockAccessor dev;
        if (auto r = BlockAccessor::Open(target, BlockAccessor::Mode::ReadWrite, dev); !r.is_ok()) {
            return r.Wrap("Target device is not writable");
        }
        if (dev.SizeSectors() < sectors) {
            return Result::Fail(ENOSPC, "Device " + target + " has " + std::to_string(dev.SizeSectors()) +
                                            " sectors, " + std::to_string(sectors) + " required");
        }
        LogInfo("Using block device %s (%llu sectors)", target.c_str(),
                static_cast<unsigned long long>(dev.SizeSectors()));
        out_sectors = dev.SizeSectors();
        return Result::Ok();
    }

    struct stat st{};
    const bool exists = ::stat(target.c_str(), &st) == 0;
    if (exists && preserve && static_cast<std::uint64_t>(st.st_size) == want_bytes) {
        LogInfo("Reusing %s", target.c_str());
        out_sectors = sectors;
        return Result::Ok();
    }

    LogInfo("Generating empty image file %s (%llu sectors)", target.c_str(),
            static_cast<unsigned long long>(sectors));
    BlockAccessor file;
    if (auto r = BlockAccessor::Open(target, BlockAccessor::Mode::CreateReadWrite, file); !r.is_ok()) {
        return r;
    }
    if (auto r = file.Truncate(0); !r.is_ok()) return r;
    if (auto r = file.Truncate(want_bytes); !r.is_ok()) return r;
    out_sectors = sectors;
    return Result::Ok();
}

Result GptTableBuilder::ExtractBootCode(const std::string& source_image, const std::string& out_path) {
    BlockAccessor source;
    if (auto r = BlockAccessor::Open(source_image, BlockAccessor::Mode::ReadOnly, source); !r.is_ok()) {
        return r;
    }
    std::vector<std::uint8_t> sector;
    if (auto r = source.ReadSectors(0, 1, sector); !r.is_ok()) {
        return r.Wrap("Cannot read PMBR of " + source_image);
    }

    FileWriter writer;
    if (auto r = FileWriter::Open(out_path, writer); !r.is_ok()) return r;
    if (auto r = writer.WriteAll(sector); !r.is_ok()) return r;
    return writer.Close();
}

Result GptTableBuilder::Install(const std::string& target, std::uint64_t sectors,
                                const std::string& pmbr_path) const {
    std::vector<PartitionSpec> specs;
    if (auto r = DefaultLayout(sectors, geometry_, specs); !r.is_ok()) return r;

    auto table = open_table_(target);
    if (auto r = table->Create(); !r.is_ok()) return r;
    for (const auto& spec : specs) {
        LogDebug("Adding #%d %s at %llu (+%llu)", spec.number, spec.label.c_str(),
                 static_cast<unsigned long long>(spec.first_sector),
                 static_cast<unsigned long long>(spec.sector_count));
        if (auto r = table->Add(spec); !r.is_ok()) return r;
    }
    if (auto r = table->WriteBootCode(pmbr_path); !r.is_ok()) return r;

    LogInfo("Installed partition table on %s", target.c_str());
    return Result::Ok();
}

Result GptTableBuilder::Activate(const std::string& target, int part,
                                 const PartitionAttributes& attrs) const {
    auto table = open_table_(target);
    return table->SetAttributes(part, attrs);
}

} // namespace fpack
