#pragma once

#include "omaha/compress_hash.hpp"
#include "omaha/manifest.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace fpack {

inline constexpr const char* kOmahaConfigName = "miniomaha.conf";
inline constexpr const char* kOmahaStaticDir = "static";

struct ServerJob {
    std::string release;
    std::string factory;
    std::string board;
    std::string subfolder;
    std::string omaha_dir;
    // Patched release kernel; partition 2 of the release image when unset.
    std::optional<std::string> release_kernel;
    std::optional<std::string> firmware_updater;
    std::optional<std::string> hwid_updater;
    std::optional<std::string> complete_script;
};

// Produces the mini-omaha payloads and records them in miniomaha.conf.
class OmahaBuilder {
  public:
    OmahaBuilder(const CompressHashPipeline& pipeline, const ManifestAggregator& aggregator);

    Result Build(const ServerJob& job, ManifestRecord& out) const;

    // <omaha_dir>/static/ or <omaha_dir>/static/<subfolder>/.
    static std::string DataDir(const std::string& omaha_dir, const std::string& subfolder);
    static std::string ConfigPath(const std::string& omaha_dir);

    // Removes payloads of an earlier run and creates the directory.
    static Result PrepareDataDir(const std::string& dir);

  private:
    Result CompressOptional(const std::optional<std::string>& input, const std::string& out_path,
                            const char* name, std::optional<std::string>& out_digest) const;

    const CompressHashPipeline& pipeline_;
    const ManifestAggregator& aggregator_;
};

} // namespace fpack
