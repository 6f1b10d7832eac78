#pragma once

#include "StompFrame.hpp"
#include <string>
#include <memory>
#include <mutex>
#include <chrono>

// Negative timeout: block until data arrives or the peer closes
constexpr std::chrono::milliseconds kStompWaitForever{-1};

// Framed byte stream over one connected TCP socket.
//
// send() may be called from several threads; each frame is written whole under
// an internal lock. recv() keeps unconsumed bytes and the partially parsed frame
// between calls, so only one thread may read at a time.
class StompStream {
public:
    static constexpr size_t DEFAULT_READ_SIZE = 4096;

    explicit StompStream(int socket, size_t readSize = DEFAULT_READ_SIZE);
    ~StompStream();

    StompStream(const StompStream&) = delete;
    StompStream& operator=(const StompStream&) = delete;

    // Resolves host and connects; throws StompError when no address accepts
    static std::unique_ptr<StompStream> open(const std::string& host, int port,
                                             size_t readSize = DEFAULT_READ_SIZE);

    void send(const StompFrame& frame);

    // Next complete frame, or nullptr at end of stream.
    // Throws StompTimeoutError when the timeout elapses first.
    std::unique_ptr<const StompFrame> recv(std::chrono::milliseconds timeout = kStompWaitForever);

    // Shuts the socket down; a blocked reader wakes with end of stream
    void close();

    bool isOpen() const;

private:
    bool waitReadable(std::chrono::steady_clock::time_point deadline, bool bounded);

    int socket_;
    size_t readSize_;
    std::string buffer_;
    std::unique_ptr<StompFrameParser> parser_;
    bool eof_ = false;
    mutable std::mutex writeMutex_;
    mutable std::mutex closeMutex_;
    bool shutdown_ = false;
};
