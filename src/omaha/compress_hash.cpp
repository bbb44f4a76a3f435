// compress_hash.cpp - Single-pass compress and digest of update payloads.

#include "omaha/compress_hash.hpp"

#include "crypto/digest.hpp"
#include "io/chain_reader.hpp"
#include "io/counting_writer.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_writer.hpp"
#include "io/stream_copy.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <stdexcept>
#include <vector>

namespace fpack {

std::string PayloadSource::Describe() const {
    if (partition) return path + "#" + std::to_string(*partition);
    return path;
}

CompressHashPipeline::CompressHashPipeline(const PartitionTransferEngine& engine) : engine_(engine) {}

Result CompressHashPipeline::CompressStream(IReader& input, const std::string& out_path,
                                            Artifact& out) const {
    FileWriter file;
    if (auto r = FileWriter::Open(out_path, file); !r.is_ok()) return r;

    Sha1Hasher hasher;
    if (!hasher.Ok()) {
        return Result::Fail(ENOMEM, "Cannot initialize SHA-1 for " + out_path);
    }
    CountingWriter counted(file);
    HashingWriter hashed(counted, hasher);

    std::uint64_t consumed = 0;
    try {
        GzipWriter gzip(hashed);
        CopyOptions opt{.expected_bytes = input.TotalSize(), .label = out_path};
        StreamCopier copier;
        if (auto r = copier.Run(input, gzip, opt, &consumed); !r.is_ok()) return r;
        if (auto r = gzip.Finish(); !r.is_ok()) return r;
    } catch (const std::exception& e) {
        return Result::Fail(EIO, std::string("Compressor failed for ") + out_path + ": " + e.what());
    }
    if (auto r = file.Close(); !r.is_ok()) return r;

    out = Artifact{.path = out_path,
                   .digest = hasher.FinalBase64(),
                   .input_bytes = consumed,
                   .output_bytes = counted.BytesWritten()};
    if (out.digest.empty()) {
        return Result::Fail(EIO, "Cannot finalize digest of " + out_path);
    }
    LogDebug("Compressed %llu -> %llu bytes into %s",
             static_cast<unsigned long long>(out.input_bytes),
             static_cast<unsigned long long>(out.output_bytes), out_path.c_str());
    return Result::Ok();
}

Result CompressHashPipeline::CompressFile(const std::string& in_path, const std::string& out_path,
                                          Artifact& out) const {
    FileReader reader;
    if (auto r = FileReader::Open(in_path, reader); !r.is_ok()) return r;
    return CompressStream(reader, out_path, out);
}

Result CompressHashPipeline::CompressPartition(const std::string& image, int part,
                                               const std::string& out_path, Artifact& out) const {
    std::unique_ptr<IReader> reader;
    if (auto r = engine_.OpenPartitionReader(image, part, reader); !r.is_ok()) return r;
    return CompressStream(*reader, out_path, out);
}

Result CompressHashPipeline::OpenSource(const PayloadSource& source, std::unique_ptr<IReader>& out) const {
    if (source.partition) {
        return engine_.OpenPartitionReader(source.path, *source.partition, out);
    }
    auto file = std::make_unique<FileReader>();
    if (auto r = FileReader::Open(source.path, *file); !r.is_ok()) return r;
    out = std::move(file);
    return Result::Ok();
}

Result CompressHashPipeline::CompressMemento(const PayloadSource& kernel, const PayloadSource& rootfs,
                                             const std::string& out_path, Artifact& out) const {
    std::unique_ptr<IReader> kernel_reader;
    if (auto r = OpenSource(kernel, kernel_reader); !r.is_ok()) return r;
    std::unique_ptr<IReader> rootfs_reader;
    if (auto r = OpenSource(rootfs, rootfs_reader); !r.is_ok()) return r;

    const auto kernel_size = kernel_reader->TotalSize();
    if (!kernel_size) {
        return Result::Fail(EINVAL, "Kernel payload has no known size: " + kernel.Describe());
    }

    std::vector<std::uint8_t> header(8);
    for (int i = 7; i >= 0; --i) {
        header[static_cast<size_t>(i)] = static_cast<std::uint8_t>(*kernel_size >> (8 * (7 - i)));
    }

    ChainReader payload;
    payload.Append(std::make_unique<BufferReader>(std::move(header)));
    payload.Append(std::move(kernel_reader));
    payload.Append(std::move(rootfs_reader));

    LogInfo("Building update payload %s from %s and %s", out_path.c_str(),
            kernel.Describe().c_str(), rootfs.Describe().c_str());
    return CompressStream(payload, out_path, out);
}

} // namespace fpack
