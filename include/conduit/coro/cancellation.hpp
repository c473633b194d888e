#pragma once

#include <atomic>
#include <memory>

namespace conduit {

// ============================================================================
// Request cancellation
// ============================================================================

/// Read side of a cancellation flag. The pipeline checks it before every
/// stage; a default-constructed token is never cancelled.
class CancellationToken {
    std::shared_ptr<const std::atomic<bool>> flag_;

    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

public:
    CancellationToken() = default;

    bool is_cancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }
};

/// Write side, held by whatever owns the client connection.
class CancellationSource {
    std::shared_ptr<std::atomic<bool>> flag_ = std::make_shared<std::atomic<bool>>(false);

public:
    CancellationToken token() const { return CancellationToken{flag_}; }

    // false when already cancelled
    bool cancel() noexcept { return !flag_->exchange(true, std::memory_order_acq_rel); }

    bool is_cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }
};

} // namespace conduit
