#include "io/file_copy.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/stream_copy.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fpack {

Result CopyFileContents(const std::string& src, const std::string& dst, std::optional<mode_t> mode) {
    FileReader reader;
    if (auto r = FileReader::Open(src, reader); !r.is_ok()) return r;

    FileWriter writer;
    if (auto r = FileWriter::Open(dst, writer); !r.is_ok()) return r;

    CopyOptions opt{.expected_bytes = reader.TotalSize(), .label = src + " -> " + dst};
    StreamCopier copier;
    if (auto r = copier.Run(reader, writer, opt); !r.is_ok()) return r;
    if (auto r = writer.Close(); !r.is_ok()) return r;

    if (mode && ::chmod(dst.c_str(), *mode) != 0) {
        const int e = errno;
        return Result::Fail(e, "chmod failed: " + dst + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result ReadWholeFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int e = errno ? errno : ENOENT;
        return Result::Fail(e, "Cannot open " + path + " (" + std::strerror(e) + ")");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return Result::Fail(EIO, "Cannot read " + path);
    out = ss.str();
    return Result::Ok();
}

Result WriteWholeFile(const std::string& path, std::string_view content) {
    FileWriter writer;
    if (auto r = FileWriter::Open(path, writer); !r.is_ok()) return r;
    if (auto r = writer.WriteAll(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
        !r.is_ok()) {
        return r;
    }
    if (auto r = writer.FsyncNow(); !r.is_ok()) return r;
    return writer.Close();
}

} // namespace fpack
