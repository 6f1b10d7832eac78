#pragma once

#include <string>
#include <vector>
#include <memory>
#include <utility>
#include <initializer_list>

// Ordered STOMP header list.
// Insertion order is kept for serialization. Assigning a name that is already
// present replaces its value in place, so on duplicates the last value wins.
class StompHeaders {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    StompHeaders() = default;
    StompHeaders(std::initializer_list<Entry> entries);

    void set(const std::string& name, const std::string& value);
    std::string get(const std::string& name, const std::string& defaultValue = "") const;
    bool has(const std::string& name) const;
    void merge(const StompHeaders& other);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Same names and values, order ignored
    bool operator==(const StompHeaders& other) const;
    bool operator!=(const StompHeaders& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

class StompFrame {
public:
    // Constructor
    StompFrame(const std::string& command,
               const StompHeaders& headers = StompHeaders(),
               const std::string& body = "");

    // Getters
    const std::string& command() const { return command_; }
    const StompHeaders& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    // Header access
    std::string get(const std::string& name, const std::string& defaultValue = "") const {
        return headers_.get(name, defaultValue);
    }
    bool has(const std::string& name) const { return headers_.has(name); }
    std::string destination() const { return headers_.get("destination"); }

    // Outgoing frames only; parsed frames are handed out const
    StompFrame& setHeader(const std::string& name, const std::string& value) {
        headers_.set(name, value);
        return *this;
    }

    // Body decoded to UTF-8 using the charset= parameter of content-type (UTF-8 if absent)
    std::string text() const;

    // Parses one complete frame; returns nullptr if the bytes do not hold a whole frame
    static std::unique_ptr<const StompFrame> parse(const std::string& frameData);

    // Serialization
    std::string serialize() const;

    // Client-side frame builders
    static std::unique_ptr<StompFrame> connect(const std::string& login = "",
                                              const std::string& passcode = "",
                                              const StompHeaders& extraHeaders = StompHeaders());
    static std::unique_ptr<StompFrame> subscribe(const std::string& destination,
                                               const std::string& subscriptionId,
                                               const std::string& ackMode);
    static std::unique_ptr<StompFrame> unsubscribe(const std::string& subscriptionId);
    static std::unique_ptr<StompFrame> send(const std::string& destination,
                                          const std::string& body);
    static std::unique_ptr<StompFrame> ack(const std::string& ackId);
    static std::unique_ptr<StompFrame> nack(const std::string& ackId);
    static std::unique_ptr<StompFrame> begin(const std::string& transactionId);
    static std::unique_ptr<StompFrame> commit(const std::string& transactionId);
    static std::unique_ptr<StompFrame> abort(const std::string& transactionId);
    static std::unique_ptr<StompFrame> disconnect();

    // Server-side frame builders
    static std::unique_ptr<StompFrame> connected(const std::string& session);
    static std::unique_ptr<StompFrame> receipt(const std::string& receiptId);
    static std::unique_ptr<StompFrame> message(const std::string& destination,
                                             const std::string& messageId,
                                             const std::string& subscription,
                                             const std::string& body);
    static std::unique_ptr<StompFrame> error(const std::string& message,
                                           const std::string& details);

    static std::string trim(const std::string& str);

private:
    std::string command_;
    StompHeaders headers_;
    std::string body_;
};

// Incremental frame parser.
//
// Bytes may be fed in chunks of any size; incomplete lines are kept inside the
// parser. process() returns the bytes that follow the terminating NUL once the
// frame is complete, and an empty string while the frame is still open. Use a
// fresh parser for every frame.
class StompFrameParser {
public:
    enum class State { AwaitCommand, ReadingHeaders, ReadingBody, Complete };

    std::string process(const std::string& data);

    State state() const { return state_; }
    bool complete() const { return state_ == State::Complete; }

    // True once anything other than heartbeat newlines has been consumed
    bool hasPartialFrame() const;

    std::unique_ptr<const StompFrame> takeFrame();

private:
    bool readLine(const std::string& data, size_t& pos, std::string& line);
    void parseHeaderLine(const std::string& line);
    void finishHeaders();
    void finishFrame();

    State state_ = State::AwaitCommand;
    std::string pendingLine_;
    std::string command_;
    StompHeaders headers_;
    std::string body_;
    bool lengthFixed_ = false;
    size_t remainingBodyBytes_ = 0;
    std::unique_ptr<StompFrame> frame_;
};
