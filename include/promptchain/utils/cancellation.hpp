#pragma once

#include <atomic>
#include <memory>

namespace promptchain::utils {

/**
 * @brief Read-only view of a cancellation flag
 *
 * A default-constructed token is never cancelled. Copies observe the same
 * flag as the source that produced them.
 */
class CancellationToken {
private:
    std::shared_ptr<const std::atomic<bool>> flag_;

    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

public:
    CancellationToken() = default;

    bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    /**
     * @brief Whether this token can ever become cancelled
     */
    bool can_be_cancelled() const { return static_cast<bool>(flag_); }
};

/**
 * @brief Owner side of a cancellation flag
 */
class CancellationSource {
private:
    std::shared_ptr<std::atomic<bool>> flag_;

public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() {
        if (flag_) {
            flag_->store(true, std::memory_order_release);
        }
    }

    bool is_cancelled() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    CancellationToken token() const {
        return CancellationToken(flag_);
    }
};

} // namespace promptchain::utils
