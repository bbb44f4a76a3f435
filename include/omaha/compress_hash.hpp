#pragma once

#include "image/partition_transfer.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fpack {

// A compressed payload written for the update server.
struct Artifact {
    std::string path;
    // base64(SHA-1) of the compressed bytes, exactly as written to `path`.
    std::string digest;
    std::uint64_t input_bytes = 0;
    std::uint64_t output_bytes = 0;
};

// Where one component of a payload comes from: a whole file, or one
// partition of an image when `partition` is set.
struct PayloadSource {
    std::string path;
    std::optional<int> partition;

    std::string Describe() const;
};

// Gzip -9 with a SHA-1 tee on the compressed side. All entry points funnel
// into CompressStream so every artifact is produced by the same chain.
class CompressHashPipeline {
  public:
    explicit CompressHashPipeline(const PartitionTransferEngine& engine);

    Result CompressStream(IReader& input, const std::string& out_path, Artifact& out) const;
    Result CompressFile(const std::string& in_path, const std::string& out_path, Artifact& out) const;
    Result CompressPartition(const std::string& image, int part, const std::string& out_path,
                             Artifact& out) const;

    // Update payload: 8-byte big-endian kernel length, kernel, rootfs.
    Result CompressMemento(const PayloadSource& kernel, const PayloadSource& rootfs,
                           const std::string& out_path, Artifact& out) const;

  private:
    Result OpenSource(const PayloadSource& source, std::unique_ptr<IReader>& out) const;

    const PartitionTransferEngine& engine_;
};

} // namespace fpack
