#pragma once

#include "image/mount_session.hpp"
#include "image/partition_transfer.hpp"
#include "system/scratch.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace fpack {

// Location of the firmware updater inside a release rootfs.
inline constexpr const char* kFirmwareUpdaterPath = "/usr/sbin/chromeos-firmwareupdate";

// Copies the firmware updater out of the rootfs of a release image.
class FirmwareUpdaterExtractor {
  public:
    FirmwareUpdaterExtractor(const PartitionTransferEngine& engine,
                             std::shared_ptr<const IMountOps> mount_ops,
                             ScratchSet& scratch);

    Result Extract(const std::string& release_image, std::string& out_path) const;

  private:
    const PartitionTransferEngine& engine_;
    std::shared_ptr<const IMountOps> mount_ops_;
    ScratchSet& scratch_;
};

} // namespace fpack
