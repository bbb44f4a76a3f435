// partition_transfer.cpp - Partition copy/overwrite between images.

#include "image/partition_transfer.hpp"

#include "image/layout.hpp"
#include "io/block_accessor.hpp"
#include "io/file_reader.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <memory>
#include <vector>

namespace fpack {

namespace {

std::string PartLabel(const std::string& image, int part) {
    return image + "#" + std::to_string(part);
}

// A RangeReader that owns the accessor it reads from.
class OwnedRangeReader final : public IReader {
  public:
    OwnedRangeReader(BlockAccessor image, const PartitionExtent& extent)
        : image_(std::move(image)), range_(image_, extent.OffsetBytes(), extent.SizeBytes()) {}

    ssize_t Read(std::span<std::uint8_t> out) override { return range_.Read(out); }
    std::optional<std::uint64_t> TotalSize() const override { return range_.TotalSize(); }

  private:
    BlockAccessor image_;
    RangeReader range_;
};

// Clears the rest of a partition after its new content, so nothing of the
// previous contents survives behind a shorter source.
Result ZeroFillTail(RangeWriter& writer, std::uint64_t capacity, const std::string& label) {
    const std::vector<std::uint8_t> zeros(StreamCopier::kBlockSize, 0);
    while (writer.BytesWritten() < capacity) {
        if (auto c = CheckCancelled(); !c.is_ok()) return c;
        const std::uint64_t n =
            std::min<std::uint64_t>(zeros.size(), capacity - writer.BytesWritten());
        if (auto r = writer.WriteAll(std::span<const std::uint8_t>(zeros.data(), static_cast<size_t>(n)));
            !r.is_ok()) {
            return r.Wrap(label);
        }
    }
    return Result::Ok();
}

} // namespace

PartitionTransferEngine::PartitionTransferEngine(PartitionTableOpener open_table)
    : PartitionTransferEngine(std::move(open_table), Options{}) {}

PartitionTransferEngine::PartitionTransferEngine(PartitionTableOpener open_table, Options opt)
    : open_table_(std::move(open_table)), opt_(opt) {}

Result PartitionTransferEngine::FindExtent(const std::string& image, int part,
                                           PartitionExtent& out) const {
    auto table = open_table_(image);
    if (!table) return Result::Fail(EINVAL, "No partition table reader for " + image);
    return table->Find(part, out);
}

Result PartitionTransferEngine::OpenPartitionReader(const std::string& image, int part,
                                                    std::unique_ptr<IReader>& out) const {
    PartitionExtent extent;
    if (auto r = FindExtent(image, part, extent); !r.is_ok()) return r;

    BlockAccessor accessor;
    if (auto r = BlockAccessor::Open(image, BlockAccessor::Mode::ReadOnly, accessor); !r.is_ok())
        return r;
    if (extent.EndSector() * kSectorSize > accessor.SizeBytes()) {
        return Result::Fail(EIO, "Partition " + PartLabel(image, part) +
                                     " extends past the end of the image");
    }
    out = std::make_unique<OwnedRangeReader>(std::move(accessor), extent);
    return Result::Ok();
}

Result PartitionTransferEngine::WriteIntoPartition(IReader& source, std::uint64_t length,
                                                   const std::string& dst_image,
                                                   const PartitionExtent& dst,
                                                   const std::string& label) const {
    BlockAccessor target;
    if (auto r = BlockAccessor::Open(dst_image, BlockAccessor::Mode::ReadWrite, target); !r.is_ok())
        return r;
    if (dst.EndSector() * kSectorSize > target.SizeBytes()) {
        return Result::Fail(ENOSPC, "Partition " + PartLabel(dst_image, dst.number) +
                                        " extends past the end of the image");
    }

    RangeWriter writer(target, dst.OffsetBytes(), dst.SizeBytes());
    CopyOptions copt{
        .fsync_interval_bytes = opt_.fsync_interval_bytes,
        .expected_bytes = length,
        .label = label,
    };
    std::uint64_t written = 0;
    if (auto r = StreamCopier{}.Run(source, writer, copt, &written); !r.is_ok()) return r;
    if (auto r = ZeroFillTail(writer, dst.SizeBytes(), label); !r.is_ok()) return r;
    if (auto r = writer.FsyncNow(); !r.is_ok()) return r;
    LogDebug("%s: %llu bytes, %llu zeroed", label.c_str(), static_cast<unsigned long long>(written),
             static_cast<unsigned long long>(dst.SizeBytes() - written));
    return Result::Ok();
}

Result PartitionTransferEngine::Copy(const std::string& src_image, int src_part,
                                     const std::string& dst_image, int dst_part) const {
    const std::string label = PartLabel(src_image, src_part) + " -> " + PartLabel(dst_image, dst_part);

    PartitionExtent dst;
    if (auto r = FindExtent(dst_image, dst_part, dst); !r.is_ok()) return r.Wrap(label);

    std::unique_ptr<IReader> source;
    if (auto r = OpenPartitionReader(src_image, src_part, source); !r.is_ok()) return r.Wrap(label);
    const std::uint64_t length = *source->TotalSize();

    if (length > dst.SizeBytes()) {
        return Result::Fail(ENOSPC, label + ": source partition (" + std::to_string(length) +
                                        " bytes) is larger than destination capacity (" +
                                        std::to_string(dst.SizeBytes()) + " bytes)");
    }
    return WriteIntoPartition(*source, length, dst_image, dst, label);
}

Result PartitionTransferEngine::CopyFromFile(const std::string& src_file,
                                             const std::string& dst_image, int dst_part) const {
    const std::string label = src_file + " -> " + PartLabel(dst_image, dst_part);

    PartitionExtent dst;
    if (auto r = FindExtent(dst_image, dst_part, dst); !r.is_ok()) return r.Wrap(label);

    FileReader source;
    if (auto r = FileReader::Open(src_file, source); !r.is_ok()) return r.Wrap(label);
    const auto length = source.TotalSize();
    if (!length) return Result::Fail(EINVAL, label + ": source is not a regular file");

    if (*length > dst.SizeBytes()) {
        return Result::Fail(ENOSPC, label + ": source file (" + std::to_string(*length) +
                                        " bytes) is larger than destination capacity (" +
                                        std::to_string(dst.SizeBytes()) + " bytes)");
    }
    return WriteIntoPartition(source, *length, dst_image, dst, label);
}

Result PartitionTransferEngine::Overwrite(const std::string& src_image, int src_part,
                                          const std::string& dst_image, int dst_part) const {
    const std::string label = PartLabel(src_image, src_part) + " => " + PartLabel(dst_image, dst_part);

    auto dst_table = open_table_(dst_image);
    if (!dst_table) return Result::Fail(EINVAL, "No partition table reader for " + dst_image);

    PartitionExtent dst;
    if (auto r = dst_table->Find(dst_part, dst); !r.is_ok()) return r.Wrap(label);

    std::unique_ptr<IReader> source;
    if (auto r = OpenPartitionReader(src_image, src_part, source); !r.is_ok()) return r.Wrap(label);
    const std::uint64_t length = *source->TotalSize();
    const std::uint64_t sectors = (length + kSectorSize - 1) / kSectorSize;

    if (sectors != dst.sector_count) {
        BlockAccessor target;
        if (auto r = BlockAccessor::Open(dst_image, BlockAccessor::Mode::ReadOnly, target); !r.is_ok())
            return r;
        const std::uint64_t total = target.SizeSectors();
        const std::uint64_t usable_end =
            total > layout::kGptReservedSectors ? total - layout::kGptReservedSectors : 0;
        const std::uint64_t new_end = dst.first_sector + sectors;
        if (new_end > usable_end) {
            return Result::Fail(ENOSPC, label + ": " + std::to_string(sectors) +
                                            " sectors do not fit before the end of " + dst_image);
        }

        std::vector<PartitionExtent> entries;
        if (auto r = dst_table->List(entries); !r.is_ok()) return r.Wrap(label);
        for (const auto& other : entries) {
            if (other.number == dst_part) continue;
            if (other.first_sector < new_end && dst.first_sector < other.EndSector()) {
                return Result::Fail(ENOSPC, label + ": resized partition would overlap #" +
                                                std::to_string(other.number));
            }
        }

        LogDebug("Resizing %s from %llu to %llu sectors", PartLabel(dst_image, dst_part).c_str(),
                 static_cast<unsigned long long>(dst.sector_count),
                 static_cast<unsigned long long>(sectors));
        if (auto r = dst_table->Resize(dst_part, sectors); !r.is_ok()) return r.Wrap(label);
        dst.sector_count = sectors;
    }

    return WriteIntoPartition(*source, length, dst_image, dst, label);
}

Result PartitionTransferEngine::Dump(const std::string& image, int part, IWriter& sink) const {
    std::unique_ptr<IReader> source;
    if (auto r = OpenPartitionReader(image, part, source); !r.is_ok()) return r;
    CopyOptions copt{
        .expected_bytes = source->TotalSize(),
        .label = "dump " + PartLabel(image, part),
    };
    return StreamCopier{}.Run(*source, sink, copt);
}

} // namespace fpack
