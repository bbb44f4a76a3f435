#pragma once

#include "io/io.hpp"

#include <vector>
#include <zlib.h>

namespace fpack {

// Deflates into `sink` with a gzip wrapper. The header carries no name and
// a zero mtime, so identical input always yields identical output.
class GzipWriter final : public IWriter {
  public:
    static constexpr int kMaxLevel = Z_BEST_COMPRESSION;

    explicit GzipWriter(IWriter& sink, int level = kMaxLevel);
    ~GzipWriter() override;

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    // Flushes the deflate trailer. No writes are accepted afterwards.
    Result Finish();

  private:
    Result Pump(int flush);

    IWriter& sink_;
    z_stream strm_{};
    std::vector<std::uint8_t> out_buffer_;
    bool initialized_ = false;
    bool finished_ = false;
};

} // namespace fpack
