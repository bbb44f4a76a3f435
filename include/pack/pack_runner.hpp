#pragma once

#include "image/gpt_builder.hpp"
#include "image/mount_session.hpp"
#include "image/partition_table.hpp"
#include "system/subprocess.hpp"
#include "util/pack_options.hpp"
#include "util/result.hpp"

#include <memory>

namespace fpack {

// External collaborators of a run. Tests replace them with fakes.
struct PackServices {
    std::shared_ptr<const ICommandRunner> runner;
    std::shared_ptr<const IMountOps> mount_ops;
    PartitionTableOpener open_table;
    GptGeometry geometry;
};

// cgpt for partition tables, the kernel loop driver for mounts.
PackServices DefaultServices();

// Fails with ENOENT when a tool the default services rely on is missing.
Result CheckRequiredTools();

class PackRunner {
  public:
    explicit PackRunner(PackServices services);

    // Runs one validated job. Every scratch file, mount and loop device of
    // the run is released before this returns.
    Result Run(const PackOptions& opt) const;

  private:
    PackServices services_;
};

} // namespace fpack
