#include "io/stream_copy.hpp"

#include "system/signals.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <vector>

namespace fpack {

namespace {

std::uint64_t NowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

Result StreamCopier::Run(IReader& reader, IWriter& writer, const CopyOptions& opt,
                         std::uint64_t* out_bytes) const {
    std::vector<std::uint8_t> buf(kBlockSize);
    const char* label = opt.label.empty() ? "copy" : opt.label.c_str();

    std::uint64_t total_written = 0;
    std::uint64_t unsynced = 0;
    const std::uint64_t t0 = NowMs();
    std::uint64_t last_print = t0;

    while (true) {
        if (auto c = CheckCancelled(); !c.is_ok()) return c;

        ssize_t n = reader.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            const int e = errno ? errno : EIO;
            return Result::Fail(e, std::string("Read failed during ") + label + " (" +
                                       std::strerror(e) + ")");
        }

        auto wr = writer.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.ok) return wr.Wrap(label);

        total_written += static_cast<std::uint64_t>(n);

        if (opt.fsync_interval_bytes != 0) {
            unsynced += static_cast<std::uint64_t>(n);
            if (unsynced >= opt.fsync_interval_bytes) {
                auto fs = writer.FsyncNow();
                if (!fs.ok) return fs;
                unsynced = 0;
            }
        }

        const auto now = NowMs();
        if (now - last_print >= 2000) {
            LogDebug("[%s] %llu bytes", label, static_cast<unsigned long long>(total_written));
            last_print = now;
        }
    }

    if (opt.expected_bytes && total_written != *opt.expected_bytes) {
        return Result::Fail(EIO, std::string("Short transfer during ") + label + ": " +
                                     std::to_string(total_written) + " of " +
                                     std::to_string(*opt.expected_bytes) + " bytes");
    }

    if (opt.fsync_interval_bytes != 0) {
        auto fs = writer.FsyncNow();
        if (!fs.ok) return fs;
    }

    double sec = static_cast<double>(NowMs() - t0) / 1000.0;
    if (sec <= 0.0) sec = 0.001;
    LogDebug("[%s] done: %llu bytes in %.2fs (%.2f MiB/s)", label,
             static_cast<unsigned long long>(total_written), sec,
             (static_cast<double>(total_written) / (1024.0 * 1024.0)) / sec);

    if (out_bytes) *out_bytes = total_written;
    return Result::Ok();
}

} // namespace fpack
