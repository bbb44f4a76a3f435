#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fpack {

struct CopyOptions {
    // Bytes between fsync() calls. 0 disables syncing.
    std::uint64_t fsync_interval_bytes = 0;
    // When set, a transfer that ends with a different byte count fails.
    std::optional<std::uint64_t> expected_bytes;
    // Used in log lines and error messages, e.g. "release.bin#3 -> disk.bin#5".
    std::string label;
};

// Streams `reader` into `writer` in fixed-size blocks, honoring the cancel flag.
class StreamCopier {
  public:
    static constexpr size_t kBlockSize = 1024 * 1024;

    Result Run(IReader& reader, IWriter& writer, const CopyOptions& opt,
               std::uint64_t* out_bytes = nullptr) const;
};

} // namespace fpack
