#pragma once
#include <atomic>
#include <memory>

namespace PV {

/**
 * CancellationToken — request-scoped cooperative cancellation signal
 *
 * Copies share the same flag. A default-constructed token has no source and is
 * never cancelled. Operations poll isCancelled() at their checkpoints; nothing
 * already started is interrupted.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static auto Create() -> CancellationToken {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() noexcept {
        if (flag_)
            flag_->store(true, std::memory_order_release);
    }

    bool isCancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace PV
