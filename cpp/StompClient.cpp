#include "StompClient.hpp"
#include "StompErrors.hpp"
#include <iostream>
#include <algorithm>

namespace {

constexpr std::chrono::milliseconds kReceiptPollInterval{50};

// Time left until deadline, never negative; kStompWaitForever when unbounded
std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline, bool bounded) {
    if (!bounded) return kStompWaitForever;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(remaining, std::chrono::milliseconds(0));
}

} // namespace

std::string toString(StompAckMode mode) {
    switch (mode) {
    case StompAckMode::Auto: return "auto";
    case StompAckMode::Client: return "client";
    case StompAckMode::ClientIndividual: return "client-individual";
    }
    throw StompError("Unknown ack mode");
}

std::string toString(StompConnectionState state) {
    switch (state) {
    case StompConnectionState::New: return "NEW";
    case StompConnectionState::Connecting: return "CONNECTING";
    case StompConnectionState::Connected: return "CONNECTED";
    case StompConnectionState::Disconnecting: return "DISCONNECTING";
    case StompConnectionState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

// StompSubscription implementation
std::shared_ptr<StompReceipt> StompSubscription::cancel() {
    return client_->unsubscribe(subscriptionId);
}

// StompClient::iterator implementation
StompClient::iterator::iterator(StompClient* client) : client_(client) {
    ++(*this);
}

StompClient::iterator& StompClient::iterator::operator++() {
    if (client_ == nullptr) {
        frame_.reset();
        return *this;
    }
    frame_ = client_->recv();
    if (!frame_) {
        client_ = nullptr;
    }
    return *this;
}

// STOMP Client Implementation
StompClient::StompClient(const StompClientOptions& options) : options_(options) {
}

StompClient::~StompClient() {
    try {
        disconnect();
    } catch (const std::exception& e) {
        std::cerr << "Error during disconnect: " << e.what() << std::endl;
    }
    close();
}

std::unique_ptr<StompClient> StompClient::open(const std::vector<StompAddress>& addresses,
                                               const std::string& login,
                                               const std::string& passcode,
                                               const StompHeaders& headers,
                                               std::chrono::milliseconds timeout,
                                               const StompClientOptions& options) {
    auto client = std::make_unique<StompClient>(options);
    client->connect(addresses, login, passcode, headers, timeout);
    return client;
}

std::unique_ptr<const StompFrame> StompClient::connect(const StompAddress& address,
                                                       const std::string& login,
                                                       const std::string& passcode,
                                                       const StompHeaders& headers,
                                                       std::chrono::milliseconds timeout) {
    return connect(std::vector<StompAddress>{address}, login, passcode, headers, timeout);
}

std::unique_ptr<const StompFrame> StompClient::connect(const std::vector<StompAddress>& addresses,
                                                       const std::string& login,
                                                       const std::string& passcode,
                                                       const StompHeaders& headers,
                                                       std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == StompConnectionState::Closed) {
            throw StompClosedError();
        }
        if (state_ != StompConnectionState::New) {
            throw StompError("Already connected");
        }
        state_ = StompConnectionState::Connecting;
    }

    auto connectFrame = StompFrame::connect(login, passcode, headers);
    std::string lastError;

    for (const auto& address : addresses) {
        std::shared_ptr<StompStream> stream;
        try {
            stream = StompStream::open(address.host, address.port, options_.readSize);
        } catch (const StompError& e) {
            std::cerr << e.what() << std::endl;
            continue;
        }

        std::unique_ptr<const StompFrame> response;
        try {
            stream->send(*connectFrame);
            response = stream->recv(timeout);
        } catch (const StompError& e) {
            lastError = e.what();
            continue;
        }

        if (!response) {
            lastError = "Connection closed by " + address.toString() + " before CONNECTED";
        } else if (response->command() == "ERROR") {
            lastError = StompProtocolError(response->get("message"), *response).what();
        } else if (response->command() != "CONNECTED") {
            lastError = "Error connecting to the broker. Unknown response command: " + response->command();
        } else {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                if (state_ == StompConnectionState::Closed) {
                    stream->close();
                    throw StompClosedError("Client closed while connecting");
                }
                stream_ = stream;
                brokerAddress_ = address;
                state_ = StompConnectionState::Connected;
            }
            log("Connected to STOMP server at " + address.toString() +
                ". Session: " + response->get("session", "-"));
            return response;
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == StompConnectionState::Connecting) {
            state_ = StompConnectionState::New;
        }
    }
    if (lastError.empty()) {
        throw StompConnectionError("Failed to connect to a broker");
    }
    throw StompConnectionError("Failed to connect to a broker: " + lastError);
}

void StompClient::disconnect() {
    disconnect(options_.disconnectTimeout);
}

void StompClient::disconnect(std::chrono::milliseconds timeout) {
    std::shared_ptr<StompStream> stream;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != StompConnectionState::Connected) return;
        state_ = StompConnectionState::Disconnecting;
        stream = stream_;
    }

    try {
        auto disconnectFrame = StompFrame::disconnect();
        auto receipt = transmit(*disconnectFrame, "", true);
        awaitReceipt(*stream, *receipt, timeout);
    } catch (const std::exception&) {
        close();
        throw;
    }

    close();
}

void StompClient::close() {
    std::shared_ptr<StompStream> stream;
    std::map<std::string, std::shared_ptr<StompReceipt>> pending;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == StompConnectionState::Closed) return;
        state_ = StompConnectionState::Closed;
        stream = std::move(stream_);
        callbacks_.clear();
        subscriptions_.clear();
        pending.swap(receipts_);
    }

    if (stream) {
        stream->close();
    }
    for (auto& [id, receipt] : pending) {
        receipt->cancel("connection closed");
    }
    log("Disconnected");
}

std::string StompClient::subscribe(const std::string& destination, StompAckMode ackMode, bool autoAck) {
    std::string subscriptionId = nextSubscriptionId();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        subscriptions_[subscriptionId] = std::make_unique<StompSubscription>(
            this, subscriptionId, destination, ackMode, autoAck);
    }

    auto subscribeFrame = StompFrame::subscribe(destination, subscriptionId, toString(ackMode));
    try {
        transmit(*subscribeFrame, "", StompReceiptRequest());
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        subscriptions_.erase(subscriptionId);
        throw;
    }

    log("Subscribed to " + destination + " with subscription ID: " + subscriptionId);
    return subscriptionId;
}

std::shared_ptr<StompReceipt> StompClient::unsubscribe(const std::string& subscriptionId) {
    std::unique_ptr<StompSubscription> subscription;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == StompConnectionState::Closed) {
            throw StompClosedError();
        }
        auto it = subscriptions_.find(subscriptionId);
        if (it != subscriptions_.end()) {
            subscription = std::move(it->second);
            subscriptions_.erase(it);
        }
    }
    if (!subscription) return nullptr;

    auto unsubscribeFrame = StompFrame::unsubscribe(subscriptionId);
    auto receipt = transmit(*unsubscribeFrame, "", true);

    log("Unsubscribed from " + subscription->destination);
    return receipt;
}

std::shared_ptr<StompReceipt> StompClient::send(const std::string& command,
                                                const StompHeaders& headers,
                                                const std::string& body,
                                                const std::string& transaction,
                                                const StompReceiptRequest& receipt) {
    StompFrame frame(command, headers, body);
    return transmit(frame, transaction, receipt);
}

std::shared_ptr<StompReceipt> StompClient::message(const std::string& destination,
                                                   const std::string& body,
                                                   const std::string& messageId,
                                                   const StompHeaders& headers,
                                                   const StompReceiptRequest& receipt,
                                                   const std::string& transaction) {
    auto sendFrame = StompFrame::send(destination, body);
    for (const auto& [name, value] : headers) {
        sendFrame->setHeader(name, value);
    }
    if (!messageId.empty()) {
        sendFrame->setHeader("message-id", messageId);
    }
    return transmit(*sendFrame, transaction, receipt);
}

void StompClient::ack(const std::string& ackId, const std::string& transaction) {
    auto ackFrame = StompFrame::ack(ackId);
    transmit(*ackFrame, transaction, StompReceiptRequest());
}

void StompClient::nack(const std::string& ackId, const std::string& transaction) {
    auto nackFrame = StompFrame::nack(ackId);
    transmit(*nackFrame, transaction, StompReceiptRequest());
}

StompTransaction StompClient::transaction(const std::string& transactionId) {
    std::string id = transactionId.empty() ? nextTransactionId() : transactionId;
    auto beginFrame = StompFrame::begin(id);
    auto receipt = transmit(*beginFrame, "", true);
    return StompTransaction(this, id, receipt);
}

std::unique_ptr<const StompFrame> StompClient::recv(const std::string& transaction,
                                                    std::chrono::milliseconds timeout) {
    auto stream = activeStream();
    bool bounded = timeout.count() >= 0;
    auto deadline = std::chrono::steady_clock::now() + (bounded ? timeout : std::chrono::milliseconds(0));

    std::lock_guard<std::mutex> reader(readMutex_);
    while (true) {
        auto frame = readFrame(*stream, remainingUntil(deadline, bounded));
        if (!frame) {
            return nullptr;
        }

        const std::string& command = frame->command();
        if (command == "RECEIPT") {
            continue;
        }
        if (command == "ERROR") {
            throw StompProtocolError(frame->get("message"), *frame);
        }
        if (command == "MESSAGE" && frame->has("ack") && shouldAutoAck(*frame)) {
            ack(frame->get("ack"), transaction);
        }
        return frame;
    }
}

std::unique_ptr<const StompFrame> StompClient::loop(const std::string& transaction,
                                                    std::chrono::milliseconds timeout) {
    while (true) {
        auto frame = recv(transaction, timeout);
        if (!frame) {
            return nullptr;
        }

        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            for (const auto& entry : callbacks_) {
                callbacks.push_back(entry.second);
            }
        }

        for (const auto& callback : callbacks) {
            if (callback(*this, *frame) == StompDispatch::Stop) {
                return frame;
            }
        }
    }
}

int StompClient::addCallback(Callback callback) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    int callbackId = nextCallbackId_++;
    callbacks_.emplace_back(callbackId, std::move(callback));
    return callbackId;
}

bool StompClient::removeCallback(int callbackId) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                           [callbackId](const std::pair<int, Callback>& entry) {
                               return entry.first == callbackId;
                           });
    if (it == callbacks_.end()) return false;
    callbacks_.erase(it);
    return true;
}

void StompClient::removeCallbacks() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    callbacks_.clear();
}

StompConnectionState StompClient::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

StompAddress StompClient::brokerAddress() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return brokerAddress_;
}

std::set<std::string> StompClient::getActiveSubscriptions() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    std::set<std::string> result;
    for (const auto& [id, subscription] : subscriptions_) {
        result.insert(id);
    }
    return result;
}

std::unique_ptr<StompSubscription> StompClient::getSubscription(const std::string& subscriptionId) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) return nullptr;
    return std::make_unique<StompSubscription>(*it->second);
}

std::string StompClient::nextId(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return prefix + "." + std::to_string(nextId_++);
}

std::shared_ptr<StompStream> StompClient::activeStream() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == StompConnectionState::Closed) {
        throw StompClosedError();
    }
    if (!stream_) {
        throw StompError("Not connected to STOMP server");
    }
    return stream_;
}

std::shared_ptr<StompReceipt> StompClient::transmit(StompFrame& frame, const std::string& transaction,
                                                    const StompReceiptRequest& receipt) {
    auto stream = activeStream();

    if (!transaction.empty()) {
        frame.setHeader("transaction", transaction);
    }

    std::shared_ptr<StompReceipt> pending;
    if (receipt.kind() != StompReceiptRequest::Kind::None) {
        std::string receiptId = receipt.kind() == StompReceiptRequest::Kind::Generate
            ? nextReceiptId() : receipt.receiptId();
        frame.setHeader("receipt", receiptId);
        // Registered before the write so a fast RECEIPT always finds it
        pending = registerReceipt(receiptId);
    }

    try {
        stream->send(frame);
    } catch (const std::exception&) {
        if (pending) dropReceipt(pending->id());
        throw;
    }
    return pending;
}

std::shared_ptr<StompReceipt> StompClient::registerReceipt(const std::string& receiptId) {
    auto receipt = std::make_shared<StompReceipt>(receiptId);
    std::shared_ptr<StompReceipt> replaced;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto& slot = receipts_[receiptId];
        replaced = std::move(slot);
        slot = receipt;
    }
    if (replaced) {
        replaced->cancel("receipt id reused");
    }
    return receipt;
}

void StompClient::dropReceipt(const std::string& receiptId) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    receipts_.erase(receiptId);
}

void StompClient::fulfilReceipt(const StompFrame& frame) {
    std::shared_ptr<StompReceipt> receipt;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto it = receipts_.find(frame.get("receipt-id"));
        if (it != receipts_.end()) {
            receipt = std::move(it->second);
            receipts_.erase(it);
        }
    }
    // Nobody waiting is fine: the caller may not have asked for this one
    if (receipt) {
        receipt->resolve(frame);
    }
}

bool StompClient::shouldAutoAck(const StompFrame& frame) const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    auto it = subscriptions_.find(frame.get("subscription"));
    if (it == subscriptions_.end()) return true;
    // The broker settles auto-mode deliveries itself
    return it->second->autoAck && it->second->ackMode != StompAckMode::Auto;
}

// Caller holds readMutex_
std::unique_ptr<const StompFrame> StompClient::readFrame(StompStream& stream, std::chrono::milliseconds timeout) {
    auto frame = stream.recv(timeout);
    if (!frame) {
        close();
        return nullptr;
    }
    if (frame->command() == "RECEIPT") {
        fulfilReceipt(*frame);
    }
    return frame;
}

void StompClient::awaitReceipt(StompStream& stream, const StompReceipt& receipt,
                               std::chrono::milliseconds timeout) {
    bool bounded = timeout.count() >= 0;
    auto deadline = std::chrono::steady_clock::now() + (bounded ? timeout : std::chrono::milliseconds(0));

    while (!receipt.isResolved() && !receipt.isCancelled()) {
        auto remaining = remainingUntil(deadline, bounded);
        if (bounded && remaining.count() == 0) {
            throw StompTimeoutError("Timed out waiting for receipt " + receipt.id());
        }

        std::unique_lock<std::mutex> reader(readMutex_, std::try_to_lock);
        if (!reader.owns_lock()) {
            // Another thread is receiving and will resolve the receipt
            receipt.waitFor(bounded ? std::min(remaining, kReceiptPollInterval) : kReceiptPollInterval);
            continue;
        }

        auto frame = readFrame(stream, remaining);
        if (!frame) return;
        if (frame->command() == "ERROR") {
            throw StompProtocolError(frame->get("message"), *frame);
        }
        if (frame->command() != "RECEIPT") {
            std::cerr << "Dropping " << frame->command() << " frame received while disconnecting" << std::endl;
        }
    }
}

void StompClient::log(const std::string& line) const {
    if (options_.verbose) {
        std::cout << line << std::endl;
    }
}
