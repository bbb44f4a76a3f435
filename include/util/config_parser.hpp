#pragma once

#include "util/pack_options.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

namespace fpack::config {

// A JSON config file holding one job object, or {"jobs": [ {...}, ... ]}.
// String values may use ${CONFIG_PATH} and ${CONFIG_DIR}, the absolute path
// and directory of the file itself.
class PackConfigFile {
  public:
    Result LoadFile(const std::string& path);

    const std::vector<PackOptions>& Jobs() const { return jobs_; }

  private:
    std::vector<PackOptions> jobs_;
};

} // namespace fpack::config
