#include "StompReceipt.hpp"
#include "StompErrors.hpp"

StompReceipt::StompReceipt(const std::string& receiptId) : receiptId_(receiptId) {
}

bool StompReceipt::resolve(const StompFrame& frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frame_ || cancelled_) return false;
        frame_ = std::make_unique<StompFrame>(frame);
    }
    condition_.notify_all();
    return true;
}

void StompReceipt::cancel(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frame_ || cancelled_) return;
        cancelled_ = true;
        cancelReason_ = reason;
    }
    condition_.notify_all();
}

bool StompReceipt::isResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frame_ != nullptr;
}

bool StompReceipt::isCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

const StompFrame& StompReceipt::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return frame_ || cancelled_; });
    return result();
}

const StompFrame& StompReceipt::wait(std::chrono::milliseconds timeout) const {
    if (timeout.count() < 0) return wait();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return frame_ || cancelled_; })) {
        throw StompTimeoutError("Timed out waiting for receipt " + receiptId_);
    }
    return result();
}

bool StompReceipt::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return condition_.wait_for(lock, timeout, [this] { return frame_ || cancelled_; });
}

// Caller holds mutex_
const StompFrame& StompReceipt::result() const {
    if (cancelled_) {
        throw StompClosedError("Receipt " + receiptId_ + " cancelled: " + cancelReason_);
    }
    return *frame_;
}
