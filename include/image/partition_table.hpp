#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fpack {

// Byte range of one numbered partition, in 512-byte sectors.
struct PartitionExtent {
    int number = 0;
    std::uint64_t first_sector = 0;
    std::uint64_t sector_count = 0;

    std::uint64_t OffsetBytes() const;
    std::uint64_t SizeBytes() const;
    // One past the last sector.
    std::uint64_t EndSector() const { return first_sector + sector_count; }
};

enum class PartitionType {
    Kernel,
    Rootfs,
    Data,
    Efi,
    Reserved,
    Firmware,
};

const char* PartitionTypeName(PartitionType type);

struct PartitionSpec {
    int number = 0;
    std::uint64_t first_sector = 0;
    std::uint64_t sector_count = 0;
    PartitionType type = PartitionType::Data;
    std::string label;
};

// Verified-boot slot attributes of a kernel partition.
struct PartitionAttributes {
    int priority = 0;
    int tries = 0;
    bool successful = false;
    std::optional<PartitionType> type;
};

// GPT reader/writer for one image. The table format itself is owned by the
// implementation; callers only see numbered extents.
class IPartitionTable {
  public:
    virtual ~IPartitionTable() = default;

    virtual const std::string& ImagePath() const = 0;

    // Fails when `number` is not present in the table.
    virtual Result Find(int number, PartitionExtent& out) const = 0;
    virtual Result List(std::vector<PartitionExtent>& out) const = 0;

    // Replaces the table with an empty one spanning the whole image.
    virtual Result Create() = 0;
    virtual Result Add(const PartitionSpec& spec) = 0;
    virtual Result Resize(int number, std::uint64_t sector_count) = 0;
    virtual Result SetAttributes(int number, const PartitionAttributes& attrs) = 0;
    // Writes a protective MBR carrying the boot code from `pmbr_path`.
    virtual Result WriteBootCode(const std::string& pmbr_path) = 0;
};

// Opens the table of the image at the given path.
using PartitionTableOpener =
    std::function<std::shared_ptr<IPartitionTable>(const std::string& image_path)>;

} // namespace fpack
