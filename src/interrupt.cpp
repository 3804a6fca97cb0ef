#include "interrupt.hpp"
#include <atomic>
#include <iostream>
#include <stdexcept>

namespace {
    // Read from the signal handler, so it must be lock-free
    std::atomic<ipfspin::CancellationSource*> g_cancel_source{nullptr};
    static_assert(ATOMIC_POINTER_LOCK_FREE == 2, "signal handler needs a lock-free pointer");

    void handleInterrupt(int) {
        if (auto* source = g_cancel_source.load()) {
            source->cancel();
        }
    }
}

InterruptCancellation::InterruptCancellation(ipfspin::CancellationSource& source) {
    ipfspin::CancellationSource* expected = nullptr;
    if (!g_cancel_source.compare_exchange_strong(expected, &source)) {
        throw std::runtime_error("Interrupt handler is already installed");
    }

    struct sigaction action {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, &previous_int_) != 0) {
        std::cerr << "[WARN] Failed to install SIGINT handler, Ctrl-C will not cancel cleanly"
                  << std::endl;
        g_cancel_source.store(nullptr);
        return;
    }
    if (sigaction(SIGTERM, &action, &previous_term_) != 0) {
        std::cerr << "[WARN] Failed to install SIGTERM handler" << std::endl;
        sigaction(SIGINT, &previous_int_, nullptr);
        g_cancel_source.store(nullptr);
        return;
    }
    installed_ = true;
}

InterruptCancellation::~InterruptCancellation() {
    if (!installed_) {
        return;
    }
    sigaction(SIGTERM, &previous_term_, nullptr);
    sigaction(SIGINT, &previous_int_, nullptr);
    g_cancel_source.store(nullptr);
}
