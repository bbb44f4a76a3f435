#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fpack {

// Owns every scratch file and directory created during one run and removes
// them, newest first, when destroyed. Mounts and loop devices are released
// by their own RAII holders before this goes out of scope.
class ScratchSet {
  public:
    explicit ScratchSet(std::string base_dir = {});
    ScratchSet(const ScratchSet&) = delete;
    ScratchSet& operator=(const ScratchSet&) = delete;
    ~ScratchSet();

    Result CreateFile(std::string_view prefix, std::string& out_path);
    Result CreateDir(std::string_view prefix, std::string& out_path);

    const std::string& BaseDir() const { return base_dir_; }
    size_t Size() const { return paths_.size(); }

    void Clear();

  private:
    std::string Template(std::string_view prefix) const;

    std::string base_dir_;
    std::vector<std::string> paths_;
};

} // namespace fpack
