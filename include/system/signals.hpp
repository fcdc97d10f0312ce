#pragma once

#include <atomic>

namespace imgbuild {

// Set by SIGINT/SIGTERM. Long-running readers poll it between blocks.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace imgbuild
