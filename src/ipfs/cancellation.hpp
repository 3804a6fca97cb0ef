#pragma once

#include <atomic>
#include <memory>

namespace ipfspin {

/**
 * CancellationToken - Read side of a cancellation flag
 *
 * Passed by value into every remote call. A default-constructed token can
 * never be cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * CancellationSource - Owner side of a cancellation flag
 *
 * cancel() may be called from any thread, including a signal handler.
 */
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }

    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace ipfspin
