#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace fpack {

// Sequential reader over an image, payload or scratch file. Directories are
// rejected with EISDIR. TotalSize() is known for regular files and block
// devices are read until EOF.
class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    ssize_t Read(std::span<std::uint8_t> out) override;

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace fpack
