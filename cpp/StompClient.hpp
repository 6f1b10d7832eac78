#pragma once

#include "StompFrame.hpp"
#include "StompStream.hpp"
#include "StompReceipt.hpp"
#include <string>
#include <memory>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <functional>
#include <map>
#include <set>
#include <vector>
#include <mutex>

// Forward declarations
class StompClient;

enum class StompAckMode { Auto, Client, ClientIndividual };

// Wire name: "auto", "client" or "client-individual"
std::string toString(StompAckMode mode);

enum class StompConnectionState { New, Connecting, Connected, Disconnecting, Closed };

std::string toString(StompConnectionState state);

// Result of a loop() callback
enum class StompDispatch { Continue, Stop };

struct StompAddress {
    std::string host;
    int port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }
};

struct StompClientOptions {
    size_t readSize = StompStream::DEFAULT_READ_SIZE;
    std::chrono::milliseconds disconnectTimeout{5000};
    bool verbose = false;
};

// Subscription holder
class StompSubscription {
public:
    std::string subscriptionId;
    std::string destination;
    StompAckMode ackMode;
    bool autoAck;

    StompSubscription(StompClient* client, const std::string& id, const std::string& dest,
                      StompAckMode mode, bool sendAcks)
        : subscriptionId(id), destination(dest), ackMode(mode), autoAck(sendAcks), client_(client) {}

    // Unsubscribes through the owning client
    std::shared_ptr<StompReceipt> cancel();

private:
    StompClient* client_;
};

// Broker-side transaction handle. Every call fails with
// StompTransactionClosedError once commit() or abort() went through.
class StompTransaction {
public:
    StompTransaction(StompClient* client, const std::string& transactionId,
                     std::shared_ptr<StompReceipt> beginReceipt = nullptr);

    StompTransaction(const StompTransaction&) = delete;
    StompTransaction& operator=(const StompTransaction&) = delete;
    StompTransaction(StompTransaction&&) = default;
    StompTransaction& operator=(StompTransaction&&) = default;

    const std::string& id() const { return transactionId_; }
    bool isClosed() const { return closed_; }
    // Receipt requested on BEGIN
    std::shared_ptr<StompReceipt> beginReceipt() const { return beginReceipt_; }

    std::shared_ptr<StompReceipt> send(const std::string& command,
                                       const StompHeaders& headers = StompHeaders(),
                                       const std::string& body = "",
                                       const StompReceiptRequest& receipt = StompReceiptRequest());
    std::shared_ptr<StompReceipt> message(const std::string& destination,
                                          const std::string& body = "",
                                          const std::string& messageId = "",
                                          const StompHeaders& headers = StompHeaders(),
                                          const StompReceiptRequest& receipt = StompReceiptRequest());
    std::unique_ptr<const StompFrame> recv(std::chrono::milliseconds timeout = kStompWaitForever);
    void ack(const std::string& ackId);
    void nack(const std::string& ackId);

    std::shared_ptr<StompReceipt> commit(const StompReceiptRequest& receipt = StompReceiptRequest());
    std::shared_ptr<StompReceipt> abort(const StompReceiptRequest& receipt = StompReceiptRequest());

private:
    void checkOpen() const;

    StompClient* client_;
    std::string transactionId_;
    std::shared_ptr<StompReceipt> beginReceipt_;
    bool closed_ = false;
};

// STOMP 1.2 client.
//
// Any thread may send. Receiving is serialized: one thread at a time reads the
// stream inside recv(), loop() or disconnect(). RECEIPT frames resolve the
// matching StompReceipt and are never returned to the caller.
class StompClient {
public:
    using Callback = std::function<StompDispatch(StompClient&, const StompFrame&)>;

    // Input iterator yielding one frame per recv(); ends when the stream closes
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = StompFrame;
        using difference_type = std::ptrdiff_t;
        using pointer = const StompFrame*;
        using reference = const StompFrame&;

        iterator() = default;
        explicit iterator(StompClient* client);

        reference operator*() const { return *frame_; }
        pointer operator->() const { return frame_.get(); }
        iterator& operator++();

        bool operator==(const iterator& other) const { return frame_ == other.frame_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        StompClient* client_ = nullptr;
        std::shared_ptr<const StompFrame> frame_;
    };

    explicit StompClient(const StompClientOptions& options = StompClientOptions());
    ~StompClient();

    StompClient(const StompClient&) = delete;
    StompClient& operator=(const StompClient&) = delete;

    // Creates a client and connects it
    static std::unique_ptr<StompClient> open(const std::vector<StompAddress>& addresses,
                                             const std::string& login = "",
                                             const std::string& passcode = "",
                                             const StompHeaders& headers = StompHeaders(),
                                             std::chrono::milliseconds timeout = kStompWaitForever,
                                             const StompClientOptions& options = StompClientOptions());

    // Connection management
    std::unique_ptr<const StompFrame> connect(const std::vector<StompAddress>& addresses,
                                              const std::string& login = "",
                                              const std::string& passcode = "",
                                              const StompHeaders& headers = StompHeaders(),
                                              std::chrono::milliseconds timeout = kStompWaitForever);
    std::unique_ptr<const StompFrame> connect(const StompAddress& address,
                                              const std::string& login = "",
                                              const std::string& passcode = "",
                                              const StompHeaders& headers = StompHeaders(),
                                              std::chrono::milliseconds timeout = kStompWaitForever);
    void disconnect();
    void disconnect(std::chrono::milliseconds timeout);
    void close();

    // Subscription management
    std::string subscribe(const std::string& destination,
                          StompAckMode ackMode = StompAckMode::Auto,
                          bool autoAck = true);
    std::shared_ptr<StompReceipt> unsubscribe(const std::string& subscriptionId);

    // Frame sending. A receipt handle is returned when one was requested.
    std::shared_ptr<StompReceipt> send(const std::string& command,
                                       const StompHeaders& headers = StompHeaders(),
                                       const std::string& body = "",
                                       const std::string& transaction = "",
                                       const StompReceiptRequest& receipt = StompReceiptRequest());
    std::shared_ptr<StompReceipt> message(const std::string& destination,
                                          const std::string& body = "",
                                          const std::string& messageId = "",
                                          const StompHeaders& headers = StompHeaders(),
                                          const StompReceiptRequest& receipt = StompReceiptRequest(),
                                          const std::string& transaction = "");
    void ack(const std::string& ackId, const std::string& transaction = "");
    void nack(const std::string& ackId, const std::string& transaction = "");
    StompTransaction transaction(const std::string& transactionId = "");

    // Frame receiving. nullptr means the connection closed.
    std::unique_ptr<const StompFrame> recv(const std::string& transaction = "",
                                           std::chrono::milliseconds timeout = kStompWaitForever);
    std::unique_ptr<const StompFrame> loop(const std::string& transaction = "",
                                           std::chrono::milliseconds timeout = kStompWaitForever);

    // Callbacks for loop(), called in registration order until one returns Stop
    int addCallback(Callback callback);
    bool removeCallback(int callbackId);
    void removeCallbacks();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Id allocation, one counter per client
    std::string nextSubscriptionId() { return nextId("s"); }
    std::string nextReceiptId() { return nextId("r"); }
    std::string nextTransactionId() { return nextId("t"); }

    // Status methods
    StompConnectionState state() const;
    bool isConnected() const { return state() == StompConnectionState::Connected; }
    StompAddress brokerAddress() const;
    std::set<std::string> getActiveSubscriptions() const;
    std::unique_ptr<StompSubscription> getSubscription(const std::string& subscriptionId) const;

private:
    friend class StompTransaction;

    std::string nextId(const std::string& prefix);
    std::shared_ptr<StompStream> activeStream() const;
    std::shared_ptr<StompReceipt> transmit(StompFrame& frame, const std::string& transaction,
                                           const StompReceiptRequest& receipt);
    std::shared_ptr<StompReceipt> registerReceipt(const std::string& receiptId);
    void dropReceipt(const std::string& receiptId);
    void fulfilReceipt(const StompFrame& frame);
    bool shouldAutoAck(const StompFrame& frame) const;
    std::unique_ptr<const StompFrame> readFrame(StompStream& stream, std::chrono::milliseconds timeout);
    void awaitReceipt(StompStream& stream, const StompReceipt& receipt,
                      std::chrono::milliseconds timeout);
    void log(const std::string& line) const;

    StompClientOptions options_;

    // Guards everything below; never held across socket I/O
    mutable std::mutex stateMutex_;
    // Held by the single reader for the duration of a receive
    std::mutex readMutex_;

    StompConnectionState state_ = StompConnectionState::New;
    std::shared_ptr<StompStream> stream_;
    StompAddress brokerAddress_;
    std::uint64_t nextId_ = 1;
    std::map<std::string, std::unique_ptr<StompSubscription>> subscriptions_;
    std::map<std::string, std::shared_ptr<StompReceipt>> receipts_;
    std::vector<std::pair<int, Callback>> callbacks_;
    int nextCallbackId_ = 1;
};
