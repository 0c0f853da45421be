#pragma once

#include <atomic>

namespace bpm {

// Set by SIGINT/SIGTERM; the installer polls it between nodes.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace bpm
