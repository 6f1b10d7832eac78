#include "StompStream.hpp"
#include "StompErrors.hpp"
#include <iostream>
#include <vector>
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

StompStream::StompStream(int socket, size_t readSize)
    : socket_(socket), readSize_(readSize > 0 ? readSize : DEFAULT_READ_SIZE),
      parser_(std::make_unique<StompFrameParser>()) {
}

StompStream::~StompStream() {
    close();
    if (socket_ >= 0) {
        ::close(socket_);
        socket_ = -1;
    }
}

std::unique_ptr<StompStream> StompStream::open(const std::string& host, int port, size_t readSize) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw StompError("Cannot resolve " + host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no usable address";
    int sock = -1;
    for (struct addrinfo* addr = result; addr != nullptr; addr = addr->ai_next) {
        sock = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (sock < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(sock, addr->ai_addr, addr->ai_addrlen) == 0) {
            break;
        }
        lastError = std::strerror(errno);
        ::close(sock);
        sock = -1;
    }
    freeaddrinfo(result);

    if (sock < 0) {
        throw StompError("Connection to " + host + ":" + service + " failed: " + lastError);
    }
    return std::make_unique<StompStream>(sock, readSize);
}

void StompStream::send(const StompFrame& frame) {
    std::string serialized = frame.serialize();

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!isOpen()) {
        throw StompClosedError("Failed to send frame: stream is closed");
    }

    size_t offset = 0;
    while (offset < serialized.size()) {
        ssize_t sent = ::send(socket_, serialized.data() + offset, serialized.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw StompError("Failed to send frame: " + std::string(std::strerror(errno)));
        }
        offset += static_cast<size_t>(sent);
    }
}

std::unique_ptr<const StompFrame> StompStream::recv(std::chrono::milliseconds timeout) {
    bool bounded = timeout.count() >= 0;
    auto deadline = std::chrono::steady_clock::now() + (bounded ? timeout : std::chrono::milliseconds(0));
    std::vector<char> chunk(readSize_);

    while (true) {
        if (!buffer_.empty()) {
            std::string rest = parser_->process(buffer_);
            buffer_.swap(rest);
            if (parser_->complete()) {
                auto frame = parser_->takeFrame();
                parser_ = std::make_unique<StompFrameParser>();
                return frame;
            }
        }

        if (eof_) {
            if (parser_->hasPartialFrame()) {
                std::cerr << "Connection closed in the middle of a frame, discarding partial frame" << std::endl;
                parser_ = std::make_unique<StompFrameParser>();
            }
            return nullptr;
        }

        if (!waitReadable(deadline, bounded)) {
            throw StompTimeoutError();
        }

        ssize_t received = ::recv(socket_, chunk.data(), chunk.size(), 0);
        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            std::cerr << "Frame reading error: " << std::strerror(errno) << std::endl;
            eof_ = true;
        } else if (received == 0) {
            eof_ = true;
        } else {
            buffer_.append(chunk.data(), static_cast<size_t>(received));
        }
    }
}

bool StompStream::waitReadable(std::chrono::steady_clock::time_point deadline, bool bounded) {
    while (true) {
        int waitMs = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            waitMs = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
        }

        struct pollfd pfd;
        pfd.fd = socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, waitMs);
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) {
            throw StompError("Failed to wait for socket: " + std::string(std::strerror(errno)));
        }
    }
}

void StompStream::close() {
    std::lock_guard<std::mutex> lock(closeMutex_);
    if (!shutdown_ && socket_ >= 0) {
        ::shutdown(socket_, SHUT_RDWR);
    }
    shutdown_ = true;
}

bool StompStream::isOpen() const {
    std::lock_guard<std::mutex> lock(closeMutex_);
    return !shutdown_ && socket_ >= 0;
}
