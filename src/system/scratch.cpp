#include "system/scratch.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace fpack {

namespace {

std::string DefaultTmpDir() {
    const char* env = std::getenv("TMPDIR");
    if (env && *env) return env;
    return "/tmp";
}

} // namespace

ScratchSet::ScratchSet(std::string base_dir)
    : base_dir_(base_dir.empty() ? DefaultTmpDir() : std::move(base_dir)) {}

ScratchSet::~ScratchSet() { Clear(); }

std::string ScratchSet::Template(std::string_view prefix) const {
    return JoinPath(base_dir_, std::string(prefix) + "XXXXXX");
}

Result ScratchSet::CreateFile(std::string_view prefix, std::string& out_path) {
    std::string tmpl = Template(prefix);
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "mkstemp failed in " + base_dir_ + ": " + std::strerror(e));
    }
    ::close(fd);
    out_path = buf.data();
    paths_.push_back(out_path);
    LogDebug("scratch file: %s", out_path.c_str());
    return Result::Ok();
}

Result ScratchSet::CreateDir(std::string_view prefix, std::string& out_path) {
    std::string tmpl = Template(prefix);
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (!::mkdtemp(buf.data())) {
        const int e = errno;
        return Result::Fail(e, "mkdtemp failed in " + base_dir_ + ": " + std::strerror(e));
    }
    out_path = buf.data();
    paths_.push_back(out_path);
    LogDebug("scratch dir: %s", out_path.c_str());
    return Result::Ok();
}

void ScratchSet::Clear() {
    for (auto it = paths_.rbegin(); it != paths_.rend(); ++it) {
        std::error_code ec;
        fs::remove_all(*it, ec);
        if (ec) {
            LogWarn("Cannot remove scratch path %s: %s", it->c_str(), ec.message().c_str());
        }
    }
    paths_.clear();
}

} // namespace fpack
