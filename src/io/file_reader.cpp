#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fpack {

Result FileReader::Open(std::string path, FileReader& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Fail(errno, "Failed to open " + path + " (" + std::strerror(errno) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0) {
        return Result::Fail(errno, "Failed to stat " + path + " (" + std::strerror(errno) + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        return Result::Fail(EISDIR, "Not a file: " + path);
    }

    out.size_ = S_ISREG(st.st_mode) ? std::optional<std::uint64_t>(static_cast<std::uint64_t>(st.st_size))
                                    : std::nullopt;
    // Advisory only; images are streamed front to back once.
    (void)::posix_fadvise(fd.Get(), 0, 0, POSIX_FADV_SEQUENTIAL);

    out.path_ = std::move(path);
    out.fd_ = std::move(fd);
    return Result::Ok();
}

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        const ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0 || errno != EINTR) return n;
    }
}

} // namespace fpack
