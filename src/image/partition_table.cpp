#include "image/partition_table.hpp"

#include "io/block_accessor.hpp"

namespace fpack {

std::uint64_t PartitionExtent::OffsetBytes() const { return first_sector * kSectorSize; }

std::uint64_t PartitionExtent::SizeBytes() const { return sector_count * kSectorSize; }

const char* PartitionTypeName(PartitionType type) {
    switch (type) {
        case PartitionType::Kernel:   return "kernel";
        case PartitionType::Rootfs:   return "rootfs";
        case PartitionType::Data:     return "data";
        case PartitionType::Efi:      return "efi";
        case PartitionType::Reserved: return "reserved";
        case PartitionType::Firmware: return "firmware";
    }
    return "data";
}

} // namespace fpack
