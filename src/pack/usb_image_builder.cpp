// usb_image_builder.cpp - Factory USB installer image generation.

#include "pack/usb_image_builder.hpp"

#include "image/layout.hpp"
#include "io/file_copy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <sys/mount.h>
#include <vector>

namespace fpack {

UsbImageBuilder::UsbImageBuilder(const PartitionTransferEngine& engine, const HwidUpdater& hwid,
                                 std::shared_ptr<const ICommandRunner> runner,
                                 std::shared_ptr<const IMountOps> mount_ops,
                                 PartitionTableOpener open_table, ScratchSet& scratch)
    : engine_(engine),
      hwid_(hwid),
      runner_(std::move(runner)),
      mount_ops_(std::move(mount_ops)),
      open_table_(std::move(open_table)),
      scratch_(scratch) {}

Result UsbImageBuilder::Build(const UsbImageJob& job) const {
    std::string release_file;
    if (auto r = PrepareReleaseImage(job, release_file); !r.is_ok()) return r;

    const std::vector<std::string> argv = {job.shim_builder, "-m", job.factory, "-f", job.usbimg,
                                           job.install_shim, job.factory, release_file};
    LogInfo("Running %s", JoinArgv(argv).c_str());
    if (auto r = runner_->Run(argv, nullptr); !r.is_ok()) {
        return r.Wrap("Universal factory shim builder failed");
    }

    if (job.hwid_updater) {
        if (auto r = hwid_.Apply(*job.hwid_updater, job.usbimg); !r.is_ok()) return r;
    }
    if (auto r = UpdateInstallerSettings(job); !r.is_ok()) return r;
    if (auto r = DeactivateKernels(job.usbimg); !r.is_ok()) return r;

    LogInfo("Generated Image at %s.", job.usbimg.c_str());
    return Result::Ok();
}

Result UsbImageBuilder::PrepareReleaseImage(const UsbImageJob& job, std::string& out_path) const {
    if (!job.release_kernel) {
        out_path = job.release;
        return Result::Ok();
    }

    // The shim builder only takes whole images, so the patched kernel goes
    // into a scratch copy of the release image.
    LogInfo("Creating temporary SSD-type release image, please wait...");
    if (auto r = scratch_.CreateFile("fpack-release-", out_path); !r.is_ok()) return r;
    if (auto r = CopyFileContents(job.release, out_path); !r.is_ok()) return r;
    return engine_.CopyFromFile(*job.release_kernel, out_path, layout::kKernelA);
}

std::string UsbImageBuilder::ComposeLsbFactory(const std::string& shim_lsb, bool with_firmware) {
    std::string out = shim_lsb;
    if (!out.empty() && out.back() != '\n') out.push_back('\n');
    out += "FACTORY_INSTALL_FROM_USB=1\n";
    // Shim kernel and rootfs take slots 2/3, so the payloads sit two slots up.
    out += "FACTORY_INSTALL_USB_OFFSET=2\n";
    if (with_firmware) {
        out += std::string("FACTORY_INSTALL_FIRMWARE=/mnt/stateful_partition/") + kUsbFirmwareUpdaterName +
               "\n";
    }
    return out;
}

Result UsbImageBuilder::UpdateInstallerSettings(const UsbImageJob& job) const {
    PartitionExtent shim_state;
    if (auto r = engine_.FindExtent(job.install_shim, layout::kStateful, shim_state); !r.is_ok()) return r;
    PartitionExtent usb_state;
    if (auto r = engine_.FindExtent(job.usbimg, layout::kStateful, usb_state); !r.is_ok()) return r;

    MountSession shim_mount(mount_ops_);
    if (auto r = MountSession::MountPartition(job.install_shim, shim_state, layout::kStatefulFsType,
                                              MS_RDONLY, scratch_.BaseDir(), shim_mount);
        !r.is_ok()) {
        return r.Wrap("Cannot mount stateful partition of install shim");
    }
    MountSession usb_mount(mount_ops_);
    if (auto r = MountSession::MountPartition(job.usbimg, usb_state, layout::kStatefulFsType, 0,
                                              scratch_.BaseDir(), usb_mount);
        !r.is_ok()) {
        return r.Wrap("Cannot mount stateful partition of " + job.usbimg);
    }

    std::string shim_lsb;
    if (auto r = ReadWholeFile(JoinPath(shim_mount.Dir(), kLsbFactoryPath), shim_lsb); !r.is_ok()) {
        return r.Wrap("Cannot read installer settings from install shim");
    }

    if (job.firmware_updater) {
        const std::string dst = JoinPath(usb_mount.Dir(), kUsbFirmwareUpdaterName);
        if (auto r = CopyFileContents(*job.firmware_updater, dst, 0755); !r.is_ok()) return r;
    }

    const std::string lsb = ComposeLsbFactory(shim_lsb, job.firmware_updater.has_value());
    if (auto r = WriteWholeFile(JoinPath(usb_mount.Dir(), kLsbFactoryPath), lsb); !r.is_ok()) return r;

    if (auto r = usb_mount.Unmount(); !r.is_ok()) return r;
    return shim_mount.Unmount();
}

Result UsbImageBuilder::DeactivateKernels(const std::string& usbimg) const {
    auto table = open_table_(usbimg);
    for (int part = layout::kKernelB; part <= layout::kRootfsC; ++part) {
        auto r = table->SetAttributes(part, PartitionAttributes{.priority = 0,
                                                                .tries = 0,
                                                                .successful = false,
                                                                .type = PartitionType::Data});
        if (!r.is_ok()) return r;
    }
    return Result::Ok();
}

} // namespace fpack
