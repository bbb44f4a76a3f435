// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <cerrno>
#include <csignal>

namespace fpack {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleSignal);
}

Result CheckCancelled() {
    if (g_cancel.load(std::memory_order_relaxed)) {
        return Result::Fail(ECANCELED, "Canceled by user");
    }
    return Result::Ok();
}

} // namespace fpack
