#include "brstitch/interrupt.hpp"

#include "brstitch/errors.hpp"

#include <atomic>
#include <stdexcept>
#include <csignal>

#ifndef _WIN32
#include <signal.h>
#endif

namespace brstitch::interrupt {

namespace {

volatile std::sig_atomic_t g_signal_pending = 0;
std::atomic<bool> g_requested{false};

void HandleSignal(int) {
    g_signal_pending = 1;
}

}  // namespace

void InstallHandlers() {
#ifdef _WIN32
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
#else
    // No SA_RESTART: a blocking read on a prompt must return with EINTR.
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0) {
        throw std::runtime_error("Failed to install interrupt handlers");
    }
#endif
}

void Request() noexcept {
    g_requested.store(true);
}

bool Pending() noexcept {
    return g_signal_pending != 0 || g_requested.load();
}

void Clear() noexcept {
    g_signal_pending = 0;
    g_requested.store(false);
}

void ThrowIfPending() {
    if (Pending()) {
        throw OperationInterrupted();
    }
}

}  // namespace brstitch::interrupt
