#pragma once

#include <signal.h>
#include "ipfs/cancellation.hpp"

/**
 * InterruptCancellation - Routes SIGINT/SIGTERM to a CancellationSource
 *
 * While an instance is alive, either signal cancels the source instead of
 * terminating the process. The previous handlers are restored on
 * destruction. Only one instance may be alive at a time.
 */
class InterruptCancellation {
public:
    explicit InterruptCancellation(ipfspin::CancellationSource& source);
    ~InterruptCancellation();

    InterruptCancellation(const InterruptCancellation&) = delete;
    InterruptCancellation& operator=(const InterruptCancellation&) = delete;

    // false if sigaction failed; signals then keep their previous behavior
    bool installed() const { return installed_; }

private:
    bool installed_ = false;
    struct sigaction previous_int_ {};
    struct sigaction previous_term_ {};
};
