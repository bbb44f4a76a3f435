#include "image/firmware_updater.hpp"

#include "image/layout.hpp"
#include "io/file_copy.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <sys/mount.h>
#include <sys/stat.h>

namespace fpack {

FirmwareUpdaterExtractor::FirmwareUpdaterExtractor(const PartitionTransferEngine& engine,
                                                   std::shared_ptr<const IMountOps> mount_ops,
                                                   ScratchSet& scratch)
    : engine_(engine), mount_ops_(std::move(mount_ops)), scratch_(scratch) {}

Result FirmwareUpdaterExtractor::Extract(const std::string& release_image, std::string& out_path) const {
    PartitionExtent rootfs;
    if (auto r = engine_.FindExtent(release_image, layout::kRootfsA, rootfs); !r.is_ok()) return r;

    MountSession mount(mount_ops_);
    if (auto r = MountSession::MountPartition(release_image, rootfs, layout::kRootfsFsType, MS_RDONLY,
                                              scratch_.BaseDir(), mount);
        !r.is_ok()) {
        return r.Wrap("Cannot mount partition #3 (rootfs) in release image " + release_image);
    }

    const std::string src = JoinPath(mount.Dir(), kFirmwareUpdaterPath);
    struct stat st{};
    if (::stat(src.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return Result::Fail(ENOENT, "No firmware updater in release image: " + release_image);
    }

    std::string dst;
    if (auto r = scratch_.CreateFile("fpack-fwupdate-", dst); !r.is_ok()) return r;
    if (auto r = CopyFileContents(src, dst, 0755); !r.is_ok()) {
        return r.Wrap("Failed to copy firmware updater from release image " + release_image);
    }
    if (auto r = mount.Unmount(); !r.is_ok()) return r;

    LogInfo("Prepared firmware updater from release image: %s:3#%s", release_image.c_str(),
            kFirmwareUpdaterPath);
    out_path = dst;
    return Result::Ok();
}

} // namespace fpack
