#pragma once

#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace fpack {

// Copies a regular file's content to `dst` (created or truncated), then
// applies `mode` when given.
Result CopyFileContents(const std::string& src, const std::string& dst,
                        std::optional<mode_t> mode = std::nullopt);

// Small text files: config snippets, boot loader configs, manifests.
Result ReadWholeFile(const std::string& path, std::string& out);
Result WriteWholeFile(const std::string& path, std::string_view content);

} // namespace fpack
