#include "io/gzip_writer.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>

namespace fpack {

GzipWriter::GzipWriter(IWriter& sink, int level) : sink_(sink), out_buffer_(64 * 1024) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;

    // 16 + MAX_WBITS asks zlib for a gzip header instead of a zlib one
    if (deflateInit2(&strm_, level, Z_DEFLATED, 16 + MAX_WBITS, 9, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib deflate");
    }
    initialized_ = true;
}

GzipWriter::~GzipWriter() {
    if (initialized_) deflateEnd(&strm_);
}

Result GzipWriter::Pump(int flush) {
    while (true) {
        strm_.next_out = out_buffer_.data();
        strm_.avail_out = static_cast<uInt>(out_buffer_.size());

        const int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            return Result::Fail(EIO, "deflate failed");
        }

        const size_t produced = out_buffer_.size() - strm_.avail_out;
        if (produced > 0) {
            auto wr = sink_.WriteAll(std::span<const std::uint8_t>(out_buffer_.data(), produced));
            if (!wr.is_ok()) return wr;
        }

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) return Result::Ok();
            continue;
        }
        // Output space left over means deflate consumed all input it could.
        if (strm_.avail_out != 0) return Result::Ok();
    }
}

Result GzipWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (finished_) return Result::Fail(EINVAL, "write after gzip stream finished");
    if (in.empty()) return Result::Ok();

    // zlib takes a non-const pointer but never writes through next_in.
    strm_.next_in = const_cast<Bytef*>(in.data());
    strm_.avail_in = static_cast<uInt>(in.size());
    auto r = Pump(Z_NO_FLUSH);
    strm_.next_in = Z_NULL;
    return r;
}

Result GzipWriter::Finish() {
    if (finished_) return Result::Ok();
    finished_ = true;
    strm_.next_in = Z_NULL;
    strm_.avail_in = 0;
    return Pump(Z_FINISH);
}

Result GzipWriter::FsyncNow() { return sink_.FsyncNow(); }

} // namespace fpack
