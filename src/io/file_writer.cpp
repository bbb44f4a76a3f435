// file_writer.cpp - Writer implementation for artifact files.

#include "io/file_writer.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fpack {

Result FileWriter::Open(std::string path, FileWriter& out) {
    out.path_ = std::move(path);

    int flags = O_WRONLY | O_CLOEXEC;
    if (!IsDevPath(out.path_)) {
        flags |= O_CREAT | O_TRUNC;
    }
    int fd = ::open(out.path_.c_str(), flags, 0644);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? EIO : errno;
        return Result::Fail(e, "Write failed: " + path_ + " (" + std::strerror(e) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    const int fd = fd_.Release();
    if (fd >= 0 && ::close(fd) == -1) {
        return Result::Fail(errno, "close failed: " + path_ + " (" + std::strerror(errno) + ")");
    }
    return Result::Ok();
}

} // namespace fpack
