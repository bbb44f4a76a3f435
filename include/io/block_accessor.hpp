#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fpack {

inline constexpr std::uint64_t kSectorSize = 512;

// Positional access to a disk image file or a block device.
class BlockAccessor {
  public:
    enum class Mode {
        ReadOnly,
        ReadWrite,
        // Regular files are created when missing. Block devices behave as ReadWrite.
        CreateReadWrite,
    };

    BlockAccessor() = default;
    BlockAccessor(BlockAccessor&&) noexcept = default;
    BlockAccessor& operator=(BlockAccessor&&) noexcept = default;

    static Result Open(std::string path, Mode mode, BlockAccessor& out);

    // Stats `path` without opening it. Missing paths are reported as not-a-device.
    static bool IsBlockDevicePath(const std::string& path);

    const std::string& Path() const { return path_; }
    bool IsBlockDevice() const { return is_block_; }
    bool Writable() const { return writable_; }
    std::uint64_t SizeBytes() const { return size_; }
    std::uint64_t SizeSectors() const { return size_ / kSectorSize; }

    // Exact-length positional I/O. A short transfer is an EIO failure.
    Result ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const;
    Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in);

    Result ReadSectors(std::uint64_t first_sector, std::uint64_t count,
                       std::vector<std::uint8_t>& out) const;

    // Regular files only; block devices have a fixed size.
    Result Truncate(std::uint64_t size_bytes);
    Result Sync();

  private:
    std::string path_;
    Fd fd_;
    bool is_block_ = false;
    bool writable_ = false;
    std::uint64_t size_ = 0;
};

// Reads `length` bytes starting at `offset`. Stops early (returns 0) at the
// end of the underlying file; callers compare the byte count to detect it.
class RangeReader final : public IReader {
  public:
    RangeReader(const BlockAccessor& source, std::uint64_t offset, std::uint64_t length);

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return length_; }

  private:
    const BlockAccessor& source_;
    std::uint64_t offset_;
    std::uint64_t length_;
    std::uint64_t pos_ = 0;
};

// Writes sequentially from `offset`, refusing to pass `capacity` bytes.
class RangeWriter final : public IWriter {
  public:
    RangeWriter(BlockAccessor& target, std::uint64_t offset, std::uint64_t capacity);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    std::uint64_t BytesWritten() const { return pos_; }

  private:
    BlockAccessor& target_;
    std::uint64_t offset_;
    std::uint64_t capacity_;
    std::uint64_t pos_ = 0;
};

} // namespace fpack
