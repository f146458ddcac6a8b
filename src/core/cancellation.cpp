#include "core/cancellation.hpp"

namespace CIP {

namespace {
    // EN: Poll period used to notice a cancelled parent while sleeping
    // FR: Période de scrutation pour détecter un parent annulé pendant le sommeil
    constexpr std::chrono::milliseconds PARENT_POLL{20};
}

CancellationToken::CancellationToken(std::shared_ptr<CancellationToken> parent)
    : parent_(std::move(parent)) {}

void CancellationToken::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return;
        }
        reason_ = reason;
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
    if (cancelled_.load()) {
        return true;
    }
    return parent_ && parent_->isCancelled();
}

std::string CancellationToken::reason() const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load()) {
            return reason_;
        }
    }
    if (parent_) {
        return parent_->reason();
    }
    return "";
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!cancelled_.load()) {
        if (parent_ && parent_->isCancelled()) {
            return true;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto slice = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (parent_ && slice > PARENT_POLL) {
            slice = PARENT_POLL;
        }
        cv_.wait_for(lock, slice);
    }
    return true;
}

} // namespace CIP
