// block_accessor.cpp - Sector-addressed access to image files and block devices.

#include "io/block_accessor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fpack {

namespace {

std::string ErrnoText(int e) { return std::string(std::strerror(e)); }

} // namespace

bool BlockAccessor::IsBlockDevicePath(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISBLK(st.st_mode);
}

Result BlockAccessor::Open(std::string path, Mode mode, BlockAccessor& out) {
    out = BlockAccessor{};
    out.path_ = std::move(path);

    int flags = O_CLOEXEC;
    switch (mode) {
        case Mode::ReadOnly:
            flags |= O_RDONLY;
            break;
        case Mode::ReadWrite:
            flags |= O_RDWR;
            break;
        case Mode::CreateReadWrite:
            flags |= O_RDWR;
            if (!IsBlockDevicePath(out.path_)) flags |= O_CREAT;
            break;
    }

    const int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "Cannot open image: " + out.path_ + " (" + ErrnoText(e) + ")");
    }
    out.fd_.Reset(fd);
    out.writable_ = (mode != Mode::ReadOnly);

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "Cannot stat image: " + out.path_ + " (" + ErrnoText(e) + ")");
    }

    if (S_ISBLK(st.st_mode)) {
        out.is_block_ = true;
        std::uint64_t bytes = 0;
        if (::ioctl(fd, BLKGETSIZE64, &bytes) != 0) {
            const int e = errno;
            return Result::Fail(e, "BLKGETSIZE64 failed: " + out.path_ + " (" + ErrnoText(e) + ")");
        }
        out.size_ = bytes;
        if (out.writable_) {
            int ro = 0;
            if (::ioctl(fd, BLKROGET, &ro) == 0 && ro != 0) {
                return Result::Fail(EROFS, "Block device is read-only: " + out.path_);
            }
        }
    } else if (S_ISREG(st.st_mode)) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        return Result::Fail(EINVAL, "Not a regular file or block device: " + out.path_);
    }

    return Result::Ok();
}

Result BlockAccessor::ReadAt(std::uint64_t offset, std::span<std::uint8_t> out) const {
    size_t done = 0;
    while (done < out.size()) {
        const ssize_t n = ::pread(fd_.Get(), out.data() + done, out.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        if (n == 0) {
            return Result::Fail(EIO, "Short read from " + path_ + " at offset " +
                                         std::to_string(offset + done));
        }
        const int e = errno;
        return Result::Fail(e, "Read failed: " + path_ + " (" + ErrnoText(e) + ")");
    }
    return Result::Ok();
}

Result BlockAccessor::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) {
    if (!writable_) {
        return Result::Fail(EBADF, "Image opened read-only: " + path_);
    }
    size_t done = 0;
    while (done < in.size()) {
        const ssize_t n = ::pwrite(fd_.Get(), in.data() + done, in.size() - done,
                                   static_cast<off_t>(offset + done));
        if (n > 0) {
            done += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        const int e = (n == 0) ? EIO : errno;
        return Result::Fail(e, "Write failed: " + path_ + " at offset " +
                                   std::to_string(offset + done) + " (" + ErrnoText(e) + ")");
    }
    if (!is_block_) size_ = std::max(size_, offset + in.size());
    return Result::Ok();
}

Result BlockAccessor::ReadSectors(std::uint64_t first_sector, std::uint64_t count,
                                  std::vector<std::uint8_t>& out) const {
    out.resize(static_cast<size_t>(count * kSectorSize));
    return ReadAt(first_sector * kSectorSize, out);
}

Result BlockAccessor::Truncate(std::uint64_t size_bytes) {
    if (is_block_) {
        return Result::Fail(EINVAL, "Cannot resize block device: " + path_);
    }
    if (::ftruncate(fd_.Get(), static_cast<off_t>(size_bytes)) != 0) {
        const int e = errno;
        return Result::Fail(e, "Cannot resize " + path_ + " to " + std::to_string(size_bytes) +
                                   " bytes (" + ErrnoText(e) + ")");
    }
    size_ = size_bytes;
    return Result::Ok();
}

Result BlockAccessor::Sync() {
    if (::fsync(fd_.Get()) != 0) {
        const int e = errno;
        return Result::Fail(e, "fsync failed: " + path_ + " (" + ErrnoText(e) + ")");
    }
    return Result::Ok();
}

RangeReader::RangeReader(const BlockAccessor& source, std::uint64_t offset, std::uint64_t length)
    : source_(source), offset_(offset), length_(length) {}

ssize_t RangeReader::Read(std::span<std::uint8_t> out) {
    if (pos_ >= length_) return 0;
    const std::uint64_t remaining = length_ - pos_;
    const size_t want = static_cast<size_t>(std::min<std::uint64_t>(out.size(), remaining));
    const std::uint64_t at = offset_ + pos_;
    if (at >= source_.SizeBytes()) return 0;
    const size_t avail = static_cast<size_t>(std::min<std::uint64_t>(want, source_.SizeBytes() - at));
    auto r = source_.ReadAt(at, out.first(avail));
    if (!r.is_ok()) {
        errno = r.err;
        return -1;
    }
    pos_ += avail;
    return static_cast<ssize_t>(avail);
}

RangeWriter::RangeWriter(BlockAccessor& target, std::uint64_t offset, std::uint64_t capacity)
    : target_(target), offset_(offset), capacity_(capacity) {}

Result RangeWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (in.size() > capacity_ - pos_) {
        return Result::Fail(ENOSPC, "Write of " + std::to_string(in.size()) + " bytes at " +
                                        std::to_string(pos_) + " exceeds partition capacity " +
                                        std::to_string(capacity_) + " in " + target_.Path());
    }
    auto r = target_.WriteAt(offset_ + pos_, in);
    if (!r.is_ok()) return r;
    pos_ += in.size();
    return Result::Ok();
}

Result RangeWriter::FsyncNow() { return target_.Sync(); }

} // namespace fpack
