#include "StompTestBroker.hpp"
#include <iostream>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>

namespace {

int openListener(int& port) {
    int serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (serverSocket < 0) {
        throw std::runtime_error("Failed to create server socket");
    }

    int opt = 1;
    if (setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        ::close(serverSocket);
        throw std::runtime_error("Failed to set socket options");
    }

    struct sockaddr_in serverAddr;
    std::memset(&serverAddr, 0, sizeof(serverAddr));
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    serverAddr.sin_port = 0;

    if (bind(serverSocket, (struct sockaddr*)&serverAddr, sizeof(serverAddr)) < 0) {
        ::close(serverSocket);
        throw std::runtime_error("Failed to bind server socket");
    }

    socklen_t addrLen = sizeof(serverAddr);
    if (getsockname(serverSocket, (struct sockaddr*)&serverAddr, &addrLen) < 0) {
        ::close(serverSocket);
        throw std::runtime_error("Failed to read server socket address");
    }
    port = ntohs(serverAddr.sin_port);
    return serverSocket;
}

} // namespace

StompTestBroker::StompTestBroker(Handler handler) : handler_(std::move(handler)) {
    serverSocket_ = openListener(port_);
    if (listen(serverSocket_, 10) < 0) {
        ::close(serverSocket_);
        throw std::runtime_error("Failed to listen on server socket");
    }

    running_ = true;
    acceptThread_ = std::thread(&StompTestBroker::run, this);
}

StompTestBroker::~StompTestBroker() {
    stop();
}

void StompTestBroker::run() {
    while (running_) {
        struct sockaddr_in clientAddr;
        socklen_t clientAddrLen = sizeof(clientAddr);

        int clientSocket = accept(serverSocket_, (struct sockaddr*)&clientAddr, &clientAddrLen);
        if (clientSocket < 0) {
            if (running_ && errno != EINTR) {
                std::cerr << "Error accepting client connection" << std::endl;
            }
            if (!running_) break;
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(clientMutex_);
            clientSocket_ = clientSocket;
        }
        try {
            handleClient(clientSocket);
        } catch (const std::exception& e) {
            std::cerr << "Test broker error: " << e.what() << std::endl;
        }
        {
            std::lock_guard<std::mutex> lock(clientMutex_);
            ::close(clientSocket_);
            clientSocket_ = -1;
        }
    }
}

void StompTestBroker::handleClient(int clientSocket) {
    auto parser = std::make_unique<StompFrameParser>();
    char chunk[1024];

    while (running_) {
        ssize_t received = recv(clientSocket, chunk, sizeof(chunk), 0);
        if (received <= 0) {
            break; // Connection closed or error
        }

        std::string data(chunk, static_cast<size_t>(received));
        {
            std::lock_guard<std::mutex> lock(framesMutex_);
            received_ += data;
        }

        while (!data.empty()) {
            data = parser->process(data);
            if (!parser->complete()) break;

            auto frame = parser->takeFrame();
            parser = std::make_unique<StompFrameParser>();

            // Recorded after the handler, so waitForFrames() also covers its reply
            if (handler_) {
                handler_(*this, *frame);
            }
            {
                std::lock_guard<std::mutex> lock(framesMutex_);
                frames_.push_back(*frame);
            }
            framesCondition_.notify_all();
        }
    }
}

void StompTestBroker::sendFrame(const StompFrame& frame) {
    sendRaw(frame.serialize());
}

void StompTestBroker::sendRaw(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(clientMutex_);
    if (clientSocket_ < 0) {
        throw std::runtime_error("No client connected to the test broker");
    }

    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t sent = send(clientSocket_, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            throw std::runtime_error("Test broker failed to send frame");
        }
        offset += static_cast<size_t>(sent);
    }
}

void StompTestBroker::closeClient() {
    std::lock_guard<std::mutex> lock(clientMutex_);
    if (clientSocket_ >= 0) {
        shutdown(clientSocket_, SHUT_RDWR);
    }
}

void StompTestBroker::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    shutdown(serverSocket_, SHUT_RDWR);
    closeClient();

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    ::close(serverSocket_);
    serverSocket_ = -1;
}

bool StompTestBroker::waitForFrames(size_t count, long timeoutMs) const {
    std::unique_lock<std::mutex> lock(framesMutex_);
    return framesCondition_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
        [this, count] { return frames_.size() >= count; });
}

std::vector<StompFrame> StompTestBroker::frames() const {
    std::lock_guard<std::mutex> lock(framesMutex_);
    return frames_;
}

std::vector<StompFrame> StompTestBroker::framesWithCommand(const std::string& command) const {
    std::lock_guard<std::mutex> lock(framesMutex_);
    std::vector<StompFrame> result;
    for (const auto& frame : frames_) {
        if (frame.command() == command) {
            result.push_back(frame);
        }
    }
    return result;
}

std::string StompTestBroker::receivedBytes() const {
    std::lock_guard<std::mutex> lock(framesMutex_);
    return received_;
}

void StompTestBroker::autoReply(StompTestBroker& broker, const StompFrame& frame) {
    if (frame.command() == "CONNECT") {
        broker.sendFrame(*StompFrame::connected("test-session"));
    }
    if (frame.has("receipt")) {
        broker.sendFrame(*StompFrame::receipt(frame.get("receipt")));
    }
    if (frame.command() == "DISCONNECT") {
        broker.closeClient();
    }
}

void StompTestBroker::connectOnly(StompTestBroker& broker, const StompFrame& frame) {
    if (frame.command() == "CONNECT") {
        broker.sendFrame(*StompFrame::connected("test-session"));
    }
}

int StompTestBroker::unusedPort() {
    int port = 0;
    int probe = openListener(port);
    ::close(probe);
    return port;
}
