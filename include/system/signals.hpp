#pragma once

#include <atomic>

namespace packsmith {

// Set by SIGINT/SIGTERM; downloads and archive reads poll it between chunks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace packsmith
