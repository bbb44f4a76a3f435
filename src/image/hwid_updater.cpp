#include "image/hwid_updater.hpp"

#include "image/layout.hpp"
#include "util/logger.hpp"

namespace fpack {

HwidUpdater::HwidUpdater(const PartitionTransferEngine& engine,
                         std::shared_ptr<const ICommandRunner> runner,
                         std::shared_ptr<const IMountOps> mount_ops)
    : engine_(engine), runner_(std::move(runner)), mount_ops_(std::move(mount_ops)) {}

Result HwidUpdater::Apply(const std::string& updater, const std::string& image) const {
    PartitionExtent stateful;
    if (auto r = engine_.FindExtent(image, layout::kStateful, stateful); !r.is_ok()) return r;

    LoopDevice loop(mount_ops_);
    if (auto r = LoopDevice::Attach(image, stateful, false, loop); !r.is_ok()) return r;

    LogInfo("Updating HWID with %s on %s", updater.c_str(), loop.Device().c_str());
    auto run = runner_->Run({"sh", updater, loop.Device()}, nullptr);
    auto detach = loop.Detach();
    if (!run.is_ok()) {
        return Result::Fail(run.err, "Failed to update HWID (" + std::to_string(run.err) + "): " + run.msg);
    }
    return detach;
}

} // namespace fpack
