#pragma once

#include "image/layout.hpp"
#include "image/partition_table.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fpack {

// Sizes of the fixed-size partitions of a freshly built table. The stateful
// partition takes whatever is left.
struct GptGeometry {
    std::uint64_t kernel_sectors = layout::kKernelSectors;
    std::uint64_t rootfs_sectors = layout::kRootfsSectors;
    std::uint64_t oem_sectors = layout::kOemSectors;
    std::uint64_t efi_sectors = layout::kEfiSectors;
    std::uint64_t min_stateful_sectors = layout::kMinStatefulSectors;
};

// Builds the target image of disk mode: sizes the file (or checks the
// device), installs an empty table with the default layout, writes PMBR boot
// code and marks the boot slot.
class GptTableBuilder {
  public:
    explicit GptTableBuilder(PartitionTableOpener open_table, GptGeometry geometry = {});

    // Partition layout for an image of `total_sectors`. Fails with ENOSPC when
    // the fixed partitions plus the minimum stateful size do not fit.
    static Result DefaultLayout(std::uint64_t total_sectors, const GptGeometry& geometry,
                                std::vector<PartitionSpec>& out);

    // Regular files are created or truncated to exactly sectors*512 bytes,
    // unless `preserve` is set and the size already matches. Block devices
    // must be writable and at least that large; `out_sectors` is then the
    // device size.
    Result PrepareTarget(const std::string& target, std::uint64_t sectors, bool preserve,
                         std::uint64_t& out_sectors) const;

    // Copies the first sector of `source_image` to `out_path`.
    static Result ExtractBootCode(const std::string& source_image, const std::string& out_path);

    // Replaces the table of `target` with the default layout and writes the
    // PMBR boot code.
    Result Install(const std::string& target, std::uint64_t sectors,
                   const std::string& pmbr_path) const;

    Result Activate(const std::string& target, int part, const PartitionAttributes& attrs) const;

  private:
    PartitionTableOpener open_table_;
    GptGeometry geometry_;
};

} // namespace fpack
