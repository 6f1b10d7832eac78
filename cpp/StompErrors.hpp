#pragma once

#include "StompFrame.hpp"
#include <stdexcept>
#include <string>

// Base class for every failure raised by the STOMP client
class StompError : public std::runtime_error {
public:
    explicit StompError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed frame bytes (bad header line, bad content-length, missing terminator)
class StompFrameError : public StompError {
public:
    explicit StompFrameError(const std::string& message)
        : StompError("Malformed STOMP frame: " + message) {}
};

// Every broker address in a connect() attempt failed
class StompConnectionError : public StompError {
public:
    explicit StompConnectionError(const std::string& message) : StompError(message) {}
};

// Broker answered with an ERROR frame
class StompProtocolError : public StompError {
public:
    StompProtocolError(const std::string& message, const StompFrame& frame)
        : StompError("STOMP Error: " + message), brokerMessage_(message), frame_(frame) {}

    const std::string& brokerMessage() const { return brokerMessage_; }
    const StompFrame& frame() const { return frame_; }

private:
    std::string brokerMessage_;
    StompFrame frame_;
};

class StompTimeoutError : public StompError {
public:
    explicit StompTimeoutError(const std::string& message = "STOMP timeout") : StompError(message) {}
};

class StompClosedError : public StompError {
public:
    explicit StompClosedError(const std::string& message = "STOMP connection is closed")
        : StompError(message) {}
};

class StompTransactionClosedError : public StompError {
public:
    explicit StompTransactionClosedError(const std::string& transactionId)
        : StompError("Transaction already closed: " + transactionId) {}
};
