#pragma once

#include "image/hwid_updater.hpp"
#include "image/mount_session.hpp"
#include "image/partition_transfer.hpp"
#include "system/scratch.hpp"
#include "system/subprocess.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace fpack {

// Shim-relative location of the factory installer settings.
inline constexpr const char* kLsbFactoryPath = "dev_image/etc/lsb-factory";
// Name of the firmware updater on the USB stateful partition.
inline constexpr const char* kUsbFirmwareUpdaterName = "chromeos-firmwareupdate";

struct UsbImageJob {
    std::string release;
    std::string factory;
    std::string install_shim;
    std::string usbimg;
    std::string shim_builder;
    std::optional<std::string> release_kernel;
    std::optional<std::string> hwid_updater;
    std::optional<std::string> firmware_updater;
};

// Builds a USB installer: install shim in slot 2/3, factory and release
// images at +2 offsets, installing from the stick instead of the network.
class UsbImageBuilder {
  public:
    UsbImageBuilder(const PartitionTransferEngine& engine, const HwidUpdater& hwid,
                    std::shared_ptr<const ICommandRunner> runner,
                    std::shared_ptr<const IMountOps> mount_ops,
                    PartitionTableOpener open_table, ScratchSet& scratch);

    Result Build(const UsbImageJob& job) const;

    // Installer settings of the shim plus the USB install keys.
    static std::string ComposeLsbFactory(const std::string& shim_lsb, bool with_firmware);

  private:
    Result PrepareReleaseImage(const UsbImageJob& job, std::string& out_path) const;
    Result UpdateInstallerSettings(const UsbImageJob& job) const;
    Result DeactivateKernels(const std::string& usbimg) const;

    const PartitionTransferEngine& engine_;
    const HwidUpdater& hwid_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::shared_ptr<const IMountOps> mount_ops_;
    PartitionTableOpener open_table_;
    ScratchSet& scratch_;
};

} // namespace fpack
