// signals.cpp - Signal handling and shared cancel flag.

#include "system/signals.hpp"

#include <csignal>

namespace imgbuild {

std::atomic_bool g_cancel{false};

namespace {

void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

} // namespace

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking reads on stdin return EINTR so the flag is seen.
    sa.sa_flags = 0;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace imgbuild
