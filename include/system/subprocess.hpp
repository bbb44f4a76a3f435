#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace fpack {

class ICommandRunner {
  public:
    virtual ~ICommandRunner() = default;

    // Runs argv[0] (looked up in PATH) and waits for it. A non-zero exit
    // status fails with that status as the error code. When `out_stdout` is
    // set, the child's stdout is captured into it; stderr is inherited.
    virtual Result Run(const std::vector<std::string>& argv, std::string* out_stdout) const = 0;
};

class PosixCommandRunner final : public ICommandRunner {
  public:
    Result Run(const std::vector<std::string>& argv, std::string* out_stdout) const override;
};

// True when `name` resolves to an executable in PATH.
bool HasCommand(const std::string& name);

std::string JoinArgv(const std::vector<std::string>& argv);

} // namespace fpack
