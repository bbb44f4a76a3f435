#pragma once

#include "image/mount_session.hpp"
#include "image/partition_transfer.hpp"
#include "system/subprocess.hpp"
#include "util/result.hpp"

#include <memory>
#include <string>

namespace fpack {

// Runs a HWID component list updater against the stateful partition of an
// image: `sh <updater> <loop device of partition 1>`.
class HwidUpdater {
  public:
    HwidUpdater(const PartitionTransferEngine& engine,
                std::shared_ptr<const ICommandRunner> runner,
                std::shared_ptr<const IMountOps> mount_ops);

    Result Apply(const std::string& updater, const std::string& image) const;

  private:
    const PartitionTransferEngine& engine_;
    std::shared_ptr<const ICommandRunner> runner_;
    std::shared_ptr<const IMountOps> mount_ops_;
};

} // namespace fpack
