#pragma once

#include "image/gpt_builder.hpp"
#include "image/hwid_updater.hpp"
#include "image/mount_session.hpp"
#include "image/partition_transfer.hpp"
#include "system/scratch.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fpack {

struct DiskImageJob {
    std::string release;
    std::string factory;
    // Image file or block device to build.
    std::string target;
    std::uint64_t sectors = 0;
    bool preserve = false;
    // Patched release kernel; partition 2 of the release image when unset.
    std::optional<std::string> release_kernel;
    std::optional<std::string> hwid_updater;
};

// Builds a disk image that boots the factory install slot (2/3) and carries
// the release image in slot 4/5.
class DiskImageBuilder {
  public:
    DiskImageBuilder(const PartitionTransferEngine& engine, const GptTableBuilder& gpt,
                     const HwidUpdater& hwid, std::shared_ptr<const IMountOps> mount_ops,
                     ScratchSet& scratch);

    Result Build(const DiskImageJob& job) const;

    // Points the legacy boot loader config in an ESP at the internal disk.
    // A missing syslinux/ directory is not an error.
    static Result PatchLegacyBootConfig(const std::string& esp_dir);

  private:
    Result TransferPartitions(const DiskImageJob& job) const;
    Result FinalizeEsp(const std::string& target) const;

    const PartitionTransferEngine& engine_;
    const GptTableBuilder& gpt_;
    const HwidUpdater& hwid_;
    std::shared_ptr<const IMountOps> mount_ops_;
    ScratchSet& scratch_;
};

} // namespace fpack
