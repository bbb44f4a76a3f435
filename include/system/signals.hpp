#pragma once

#include "util/result.hpp"

#include <atomic>

namespace fpack {

extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

// Fails with ECANCELED once an interrupt was received.
Result CheckCancelled();

} // namespace fpack
