#pragma once

#include "image/partition_table.hpp"
#include "io/io.hpp"
#include "io/stream_copy.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace fpack {

// Moves partition contents between images, addressed by partition number.
// Every transfer streams through a fixed-size buffer and fails on the first
// short read or write.
class PartitionTransferEngine {
  public:
    struct Options {
        std::uint64_t fsync_interval_bytes = 64ULL * 1024 * 1024;
    };

    explicit PartitionTransferEngine(PartitionTableOpener open_table);
    PartitionTransferEngine(PartitionTableOpener open_table, Options opt);

    // Copies source partition content into a destination partition whose size
    // is fixed by the layout and zeroes whatever capacity the source does not
    // cover. Fails, without writing, when the source is larger than the
    // destination capacity.
    Result Copy(const std::string& src_image, int src_part,
                const std::string& dst_image, int dst_part) const;

    // Same as Copy with a plain file as the source.
    Result CopyFromFile(const std::string& src_file,
                        const std::string& dst_image, int dst_part) const;

    // Redefines the destination partition to the source partition's length,
    // then copies. Fails when the resized partition would overlap another
    // entry or run past the last usable sector.
    Result Overwrite(const std::string& src_image, int src_part,
                     const std::string& dst_image, int dst_part) const;

    // Streams one partition of `image` into `sink`.
    Result Dump(const std::string& image, int part, IWriter& sink) const;

    // Opens a reader over one partition of `image`; TotalSize() is the partition length.
    Result OpenPartitionReader(const std::string& image, int part,
                               std::unique_ptr<IReader>& out) const;

    Result FindExtent(const std::string& image, int part, PartitionExtent& out) const;

  private:
    Result WriteIntoPartition(IReader& source, std::uint64_t length,
                              const std::string& dst_image, const PartitionExtent& dst,
                              const std::string& label) const;

    PartitionTableOpener open_table_;
    Options opt_;
};

} // namespace fpack
