// pack_runner.cpp - Wires one job through kernel resolution and the mode builder.

#include "pack/pack_runner.hpp"

#include "image/cgpt_partition_table.hpp"
#include "image/firmware_updater.hpp"
#include "image/hwid_updater.hpp"
#include "image/kernel_resolver.hpp"
#include "image/partition_transfer.hpp"
#include "omaha/compress_hash.hpp"
#include "omaha/manifest.hpp"
#include "omaha/omaha_builder.hpp"
#include "pack/disk_image_builder.hpp"
#include "pack/usb_image_builder.hpp"
#include "system/scratch.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <optional>

namespace fpack {

namespace {

std::optional<std::string> NonEmpty(const std::string& s) {
    if (s.empty() || s == kNoneValue) return std::nullopt;
    return s;
}

} // namespace

PackServices DefaultServices() {
    auto runner = std::make_shared<PosixCommandRunner>();
    return PackServices{.runner = runner,
                        .mount_ops = DefaultMountOps(),
                        .open_table = CgptTableOpener(runner),
                        .geometry = {}};
}

Result CheckRequiredTools() {
    if (!HasCommand(CgptPartitionTable::kTool)) {
        return Result::Fail(ENOENT, "Missing partition tool 'cgpt'. Please install cgpt.");
    }
    return Result::Ok();
}

PackRunner::PackRunner(PackServices services) : services_(std::move(services)) {}

Result PackRunner::Run(const PackOptions& opt) const {
    LogInfo("Mode: %s", PackModeName(opt.Mode()));

    ScratchSet scratch(opt.scratch_dir);
    PartitionTransferEngine engine(services_.open_table);

    std::optional<std::string> release_kernel;
    if (opt.detect_release_image) {
        KernelResolver resolver(engine, services_.mount_ops, scratch);
        ResolvedKernel kernel;
        if (auto r = resolver.Resolve(opt.release, kernel); !r.is_ok()) return r;
        release_kernel = kernel.patched_path;
    }

    std::optional<std::string> firmware;
    switch (opt.Firmware()) {
        case FirmwareSource::Disabled:
            break;
        case FirmwareSource::File:
            firmware = opt.firmware_updater;
            break;
        case FirmwareSource::FromRelease: {
            FirmwareUpdaterExtractor extractor(engine, services_.mount_ops, scratch);
            std::string path;
            if (auto r = extractor.Extract(opt.release, path); !r.is_ok()) return r;
            firmware = path;
            break;
        }
    }

    HwidUpdater hwid(engine, services_.runner, services_.mount_ops);
    const auto hwid_updater = NonEmpty(opt.hwid_updater);

    switch (opt.Mode()) {
        case PackMode::DiskImage: {
            GptTableBuilder gpt(services_.open_table, services_.geometry);
            DiskImageBuilder builder(engine, gpt, hwid, services_.mount_ops, scratch);
            return builder.Build(DiskImageJob{.release = opt.release,
                                              .factory = opt.factory,
                                              .target = opt.diskimg,
                                              .sectors = opt.sectors,
                                              .preserve = opt.preserve,
                                              .release_kernel = release_kernel,
                                              .hwid_updater = hwid_updater});
        }
        case PackMode::UsbImage: {
            UsbImageBuilder builder(engine, hwid, services_.runner, services_.mount_ops,
                                    services_.open_table, scratch);
            return builder.Build(UsbImageJob{.release = opt.release,
                                             .factory = opt.factory,
                                             .install_shim = opt.install_shim,
                                             .usbimg = opt.usbimg,
                                             .shim_builder = opt.shim_builder,
                                             .release_kernel = release_kernel,
                                             .hwid_updater = hwid_updater,
                                             .firmware_updater = firmware});
        }
        case PackMode::Server: {
            CompressHashPipeline pipeline(engine);
            ManifestAggregator aggregator;
            OmahaBuilder builder(pipeline, aggregator);
            ManifestRecord record;
            return builder.Build(ServerJob{.release = opt.release,
                                           .factory = opt.factory,
                                           .board = opt.board,
                                           .subfolder = opt.subfolder,
                                           .omaha_dir = opt.omaha_dir,
                                           .release_kernel = release_kernel,
                                           .firmware_updater = firmware,
                                           .hwid_updater = hwid_updater,
                                           .complete_script = NonEmpty(opt.complete_script)},
                                 record);
        }
    }
    return Result::Fail(EINVAL, "Unhandled mode");
}

} // namespace fpack
