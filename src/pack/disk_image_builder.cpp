// disk_image_builder.cpp - Composite factory disk image generation.

#include "pack/disk_image_builder.hpp"

#include "image/layout.hpp"
#include "io/file_copy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <filesystem>
#include <initializer_list>
#include <string_view>
#include <system_error>

namespace fpack {

namespace {

struct TextEdit {
    const char* from;
    const char* to;
    // Otherwise only the first match on each line, like sed without /g.
    bool every_match = false;
};

size_t ReplaceFirstPerLine(std::string& text, std::string_view from, std::string_view to) {
    size_t count = 0;
    size_t line = 0;
    while (line < text.size()) {
        size_t eol = text.find('\n', line);
        if (eol == std::string::npos) eol = text.size();
        const size_t pos = text.find(from, line);
        if (pos != std::string::npos && pos + from.size() <= eol) {
            text.replace(pos, from.size(), to);
            eol = eol - from.size() + to.size();
            ++count;
        }
        line = eol + 1;
    }
    return count;
}

Result EditTextFile(const std::string& path, std::initializer_list<TextEdit> edits) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LogWarn("Legacy boot config not found: %s", path.c_str());
        return Result::Ok();
    }
    std::string text;
    if (auto r = ReadWholeFile(path, text); !r.is_ok()) return r;
    size_t changed = 0;
    for (const auto& e : edits) {
        changed += e.every_match ? ReplaceAll(text, e.from, e.to) : ReplaceFirstPerLine(text, e.from, e.to);
    }
    if (changed == 0) return Result::Ok();
    LogDebug("%zu replacements in %s", changed, path.c_str());
    return WriteWholeFile(path, text);
}

} // namespace

DiskImageBuilder::DiskImageBuilder(const PartitionTransferEngine& engine, const GptTableBuilder& gpt,
                                   const HwidUpdater& hwid, std::shared_ptr<const IMountOps> mount_ops,
                                   ScratchSet& scratch)
    : engine_(engine), gpt_(gpt), hwid_(hwid), mount_ops_(std::move(mount_ops)), scratch_(scratch) {}

Result DiskImageBuilder::Build(const DiskImageJob& job) const {
    // Legacy BIOS boot code for the PMBR.
    std::string pmbr;
    if (auto r = scratch_.CreateFile("fpack-pmbr-", pmbr); !r.is_ok()) return r;
    if (auto r = GptTableBuilder::ExtractBootCode(job.release, pmbr); !r.is_ok()) return r;

    std::uint64_t sectors = 0;
    if (auto r = gpt_.PrepareTarget(job.target, job.sectors, job.preserve, sectors); !r.is_ok()) return r;
    if (auto r = gpt_.Install(job.target, sectors, pmbr); !r.is_ok()) return r;
    if (auto r = gpt_.Activate(job.target, layout::kDiskFactoryKernel,
                               PartitionAttributes{.priority = 1, .successful = true});
        !r.is_ok()) {
        return r;
    }

    if (auto r = TransferPartitions(job); !r.is_ok()) return r;

    if (job.hwid_updater) {
        if (auto r = hwid_.Apply(*job.hwid_updater, job.target); !r.is_ok()) return r;
    }

    if (auto r = FinalizeEsp(job.target); !r.is_ok()) return r;

    LogInfo("Generated Image at %s.", job.target.c_str());
    return Result::Ok();
}

Result DiskImageBuilder::TransferPartitions(const DiskImageJob& job) const {
    using namespace layout;

    LogInfo("Release Kernel");
    if (job.release_kernel) {
        if (auto r = engine_.CopyFromFile(*job.release_kernel, job.target, kDiskReleaseKernel); !r.is_ok())
            return r;
    } else {
        if (auto r = engine_.Copy(job.release, kKernelA, job.target, kDiskReleaseKernel); !r.is_ok())
            return r;
    }
    LogInfo("Release Rootfs");
    if (auto r = engine_.Overwrite(job.release, kRootfsA, job.target, kDiskReleaseRootfs); !r.is_ok())
        return r;
    LogInfo("OEM partition");
    if (auto r = engine_.Overwrite(job.release, kOem, job.target, kOem); !r.is_ok()) return r;

    LogInfo("Factory Kernel");
    if (auto r = engine_.Copy(job.factory, kKernelA, job.target, kDiskFactoryKernel); !r.is_ok())
        return r;
    LogInfo("Factory Rootfs");
    if (auto r = engine_.Overwrite(job.factory, kRootfsA, job.target, kDiskFactoryRootfs); !r.is_ok())
        return r;
    LogInfo("Factory Stateful");
    if (auto r = engine_.Overwrite(job.factory, kStateful, job.target, kStateful); !r.is_ok()) return r;
    LogInfo("EFI Partition");
    return engine_.Copy(job.factory, kEfi, job.target, kEfi);
}

Result DiskImageBuilder::FinalizeEsp(const std::string& target) const {
    PartitionExtent esp;
    if (auto r = engine_.FindExtent(target, layout::kEfi, esp); !r.is_ok()) return r;

    MountSession mount(mount_ops_);
    if (auto r = MountSession::MountPartition(target, esp, layout::kEfiFsType, 0, scratch_.BaseDir(), mount);
        !r.is_ok()) {
        return r.Wrap("Cannot mount EFI partition of " + target);
    }
    if (auto r = PatchLegacyBootConfig(mount.Dir()); !r.is_ok()) return r;
    return mount.Unmount();
}

Result DiskImageBuilder::PatchLegacyBootConfig(const std::string& esp_dir) {
    const std::string syslinux = JoinPath(esp_dir, "syslinux");
    std::error_code ec;
    if (!std::filesystem::is_directory(syslinux, ec)) {
        LogDebug("No syslinux directory in ESP");
        return Result::Ok();
    }

    // Both vboot and regular boot entries.
    if (auto r = EditTextFile(JoinPath(syslinux, "default.cfg"),
                              {{"chromeos-usb.A", "chromeos-hd.A"}, {"chromeos-vusb.A", "chromeos-vhd.A"}});
        !r.is_ok()) {
        return r;
    }
    // Legacy loaders only exist on x86, where the rootfs is always sda3.
    return EditTextFile(JoinPath(syslinux, "root.A.cfg"), {{"HDROOTA", "/dev/sda3", true}});
}

} // namespace fpack
