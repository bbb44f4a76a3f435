#pragma once

#include "image/kernel_classifier.hpp"
#include "image/mount_session.hpp"
#include "image/partition_transfer.hpp"
#include "system/scratch.hpp"
#include "util/result.hpp"

#include <memory>
#include <optional>
#include <string>

namespace fpack {

// Name of the boot block kept on the stateful partition of usb/recovery images.
inline constexpr const char* kBootBlockName = "vmlinuz_hd.vblock";

// The kernel to install from a source image.
struct ResolvedKernel {
    KernelVariant variant = KernelVariant::Ssd;
    // Set for usb/recovery: a patched, self-contained kernel blob. Empty for
    // ssd, where partition 2 of the image is used directly.
    std::optional<std::string> patched_path;
};

class KernelResolver {
  public:
    KernelResolver(const PartitionTransferEngine& engine,
                   std::shared_ptr<const IMountOps> mount_ops,
                   ScratchSet& scratch);

    // Classifies `image` and produces the kernel payload for its variant.
    Result Resolve(const std::string& image, ResolvedKernel& out) const;

    // Resolves an already classified kernel. `extracted_kernel` is a scratch
    // copy of partition 2 and may be patched in place.
    Result ResolveClassified(const std::string& image, const ClassifiedKernel& kernel,
                             ResolvedKernel& out) const;

  private:
    Result PatchBootBlock(const std::string& image, const std::string& kernel_path) const;

    const PartitionTransferEngine& engine_;
    std::shared_ptr<const IMountOps> mount_ops_;
    ScratchSet& scratch_;
};

// Writes `patch_path` over the start of `target_path` without truncating it.
// Fails when the patch is empty or longer than the target.
Result OverlayFileHead(const std::string& patch_path, const std::string& target_path);

} // namespace fpack
