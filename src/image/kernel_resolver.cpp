// kernel_resolver.cpp - Produces the installable kernel for a classified image.

#include "image/kernel_resolver.hpp"

#include "image/layout.hpp"
#include "io/block_accessor.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <sys/mount.h>
#include <sys/stat.h>
#include <vector>

namespace fpack {

Result OverlayFileHead(const std::string& patch_path, const std::string& target_path) {
    BlockAccessor patch;
    if (auto r = BlockAccessor::Open(patch_path, BlockAccessor::Mode::ReadOnly, patch); !r.is_ok()) {
        return r;
    }
    if (patch.SizeBytes() == 0) {
        return Result::Fail(ENOENT, "Boot block is empty: " + patch_path);
    }

    BlockAccessor target;
    if (auto r = BlockAccessor::Open(target_path, BlockAccessor::Mode::ReadWrite, target); !r.is_ok()) {
        return r;
    }
    if (patch.SizeBytes() > target.SizeBytes()) {
        return Result::Fail(ENOSPC, "Boot block " + patch_path + " (" + std::to_string(patch.SizeBytes()) +
                                        " bytes) is larger than kernel " + target_path);
    }

    std::vector<std::uint8_t> bytes(patch.SizeBytes());
    if (auto r = patch.ReadAt(0, bytes); !r.is_ok()) return r;
    if (auto r = target.WriteAt(0, bytes); !r.is_ok()) return r;
    return target.Sync();
}

KernelResolver::KernelResolver(const PartitionTransferEngine& engine,
                               std::shared_ptr<const IMountOps> mount_ops,
                               ScratchSet& scratch)
    : engine_(engine), mount_ops_(std::move(mount_ops)), scratch_(scratch) {}

Result KernelResolver::Resolve(const std::string& image, ResolvedKernel& out) const {
    ClassifiedKernel kernel;
    ImageClassifier classifier(engine_, scratch_);
    if (auto r = classifier.Classify(image, kernel); !r.is_ok()) return r;
    return ResolveClassified(image, kernel, out);
}

Result KernelResolver::ResolveClassified(const std::string& image, const ClassifiedKernel& kernel,
                                         ResolvedKernel& out) const {
    out = ResolvedKernel{.variant = kernel.variant};

    switch (kernel.variant) {
        case KernelVariant::Ssd:
            return Result::Ok();

        case KernelVariant::Usb:
            if (auto r = PatchBootBlock(image, kernel.extracted_path); !r.is_ok()) return r;
            out.patched_path = kernel.extracted_path;
            return Result::Ok();

        case KernelVariant::Recovery: {
            // The real kernel of a recovery image sits in the B slot.
            FileWriter writer;
            if (auto r = FileWriter::Open(kernel.extracted_path, writer); !r.is_ok()) return r;
            if (auto r = engine_.Dump(image, layout::kRecoveryKernel, writer); !r.is_ok()) {
                return r.Wrap("Cannot extract real kernel for recovery image " + image);
            }
            if (auto r = writer.Close(); !r.is_ok()) return r;
            if (auto r = PatchBootBlock(image, kernel.extracted_path); !r.is_ok()) return r;
            out.patched_path = kernel.extracted_path;
            return Result::Ok();
        }
    }
    return Result::Fail(EINVAL, "Unhandled kernel variant for image " + image);
}

Result KernelResolver::PatchBootBlock(const std::string& image, const std::string& kernel_path) const {
    PartitionExtent stateful;
    if (auto r = engine_.FindExtent(image, layout::kStateful, stateful); !r.is_ok()) {
        return r.Wrap("No stateful partition in " + image);
    }

    MountSession mount(mount_ops_);
    if (auto r = MountSession::MountPartition(image, stateful, layout::kStatefulFsType, MS_RDONLY, scratch_.BaseDir(), mount);
        !r.is_ok()) {
        return r.Wrap("Cannot mount stateful partition of " + image);
    }

    const std::string boot_block = JoinPath(mount.Dir(), kBootBlockName);
    struct stat st{};
    if (::stat(boot_block.c_str(), &st) != 0 || !S_ISREG(st.st_mode) || st.st_size == 0) {
        return Result::Fail(ENOENT, std::string("Missing ") + kBootBlockName +
                                        " in stateful partition: " + image);
    }

    if (auto r = OverlayFileHead(boot_block, kernel_path); !r.is_ok()) {
        return r.Wrap(std::string("Cannot update kernel with ") + kBootBlockName);
    }
    LogInfo("Patched kernel with %s from %s", kBootBlockName, image.c_str());
    return mount.Unmount();
}

} // namespace fpack
