#pragma once

#include "StompFrame.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include <condition_variable>

// Single-assignment handle for a requested receipt.
//
// Resolved once by the receiving thread with the broker's RECEIPT frame, or
// cancelled when the connection closes. Any number of threads may wait on it.
class StompReceipt {
public:
    explicit StompReceipt(const std::string& receiptId);

    const std::string& id() const { return receiptId_; }

    // First call wins; returns false if already resolved or cancelled
    bool resolve(const StompFrame& frame);
    void cancel(const std::string& reason);

    bool isResolved() const;
    bool isCancelled() const;

    // Blocks until resolved. Throws StompClosedError if cancelled,
    // StompTimeoutError if the timeout elapses first.
    const StompFrame& wait() const;
    const StompFrame& wait(std::chrono::milliseconds timeout) const;

    // Returns true once resolved or cancelled, false on timeout
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    const StompFrame& result() const;

    std::string receiptId_;
    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
    std::unique_ptr<StompFrame> frame_;
    bool cancelled_ = false;
    std::string cancelReason_;
};

// Receipt requested on a frame: none, generated by the client, or an explicit id
class StompReceiptRequest {
public:
    enum class Kind { None, Generate, Explicit };

    StompReceiptRequest() = default;
    StompReceiptRequest(bool requested) : kind_(requested ? Kind::Generate : Kind::None) {}
    StompReceiptRequest(const std::string& receiptId)
        : kind_(receiptId.empty() ? Kind::None : Kind::Explicit), receiptId_(receiptId) {}
    StompReceiptRequest(const char* receiptId) : StompReceiptRequest(std::string(receiptId)) {}

    Kind kind() const { return kind_; }
    const std::string& receiptId() const { return receiptId_; }

private:
    Kind kind_ = Kind::None;
    std::string receiptId_;
};
