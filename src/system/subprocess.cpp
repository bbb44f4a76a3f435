// subprocess.cpp - fork/exec helper for the external partition and shim tools.

#include "system/subprocess.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fpack {

namespace {

Result WaitChild(pid_t pid, const std::vector<std::string>& argv) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            const int e = errno;
            return Result::Fail(e, "waitpid failed for " + argv[0] + ": " + std::strerror(e));
        }
    }
    if (WIFEXITED(status)) {
        const int code = WEXITSTATUS(status);
        if (code == 0) return Result::Ok();
        return Result::Fail(code, "Command failed (exit " + std::to_string(code) + "): " +
                                      JoinArgv(argv));
    }
    if (WIFSIGNALED(status)) {
        return Result::Fail(EINTR, "Command killed by signal " +
                                       std::to_string(WTERMSIG(status)) + ": " + JoinArgv(argv));
    }
    return Result::Fail(EIO, "Command ended abnormally: " + JoinArgv(argv));
}

} // namespace

std::string JoinArgv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

bool HasCommand(const std::string& name) {
    if (name.find('/') != std::string::npos) return ::access(name.c_str(), X_OK) == 0;
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        const std::string candidate = dir + "/" + name;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

Result PosixCommandRunner::Run(const std::vector<std::string>& argv,
                               std::string* out_stdout) const {
    if (argv.empty()) return Result::Fail(EINVAL, "empty command line");
    LogDebug("exec: %s", JoinArgv(argv).c_str());

    int pipe_fds[2] = {-1, -1};
    if (out_stdout && ::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("pipe failed: ") + std::strerror(e));
    }
    Fd read_end(pipe_fds[0]);
    Fd write_end(pipe_fds[1]);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        return Result::Fail(e, std::string("fork failed: ") + std::strerror(e));
    }
    if (pid == 0) {
        if (out_stdout) {
            ::dup2(write_end.Get(), STDOUT_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    write_end.Close();
    if (out_stdout) {
        out_stdout->clear();
        char buf[4096];
        while (true) {
            const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
            if (n > 0) {
                out_stdout->append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            break;
        }
    }
    return WaitChild(pid, argv);
}

} // namespace fpack
