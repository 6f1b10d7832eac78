#include "StompFrame.hpp"
#include "StompErrors.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iconv.h>

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string charsetOf(const std::string& contentType) {
    std::istringstream stream(contentType);
    std::string param;
    while (std::getline(stream, param, ';')) {
        param = StompFrame::trim(param);
        if (param.compare(0, 8, "charset=") == 0) {
            std::string charset = param.substr(8);
            if (charset.size() >= 2 && charset.front() == '"' && charset.back() == '"') {
                charset = charset.substr(1, charset.size() - 2);
            }
            return charset;
        }
    }
    return "";
}

std::string decodeToUtf8(const std::string& bytes, const std::string& charset) {
    iconv_t cd = iconv_open("UTF-8", charset.c_str());
    if (cd == reinterpret_cast<iconv_t>(-1)) {
        throw StompError("Unsupported charset: " + charset);
    }

    std::string input(bytes);
    char* in = &input[0];
    size_t inLeft = input.size();
    std::string output(input.size() * 2 + 16, '\0');
    size_t produced = 0;

    while (inLeft > 0) {
        char* out = &output[produced];
        size_t outLeft = output.size() - produced;
        size_t rc = iconv(cd, &in, &inLeft, &out, &outLeft);
        produced = output.size() - outLeft;
        if (rc != static_cast<size_t>(-1)) {
            break;
        }
        if (errno == E2BIG) {
            output.resize(output.size() * 2);
            continue;
        }
        iconv_close(cd);
        throw StompError("Cannot decode frame body as " + charset);
    }

    iconv_close(cd);
    output.resize(produced);
    return output;
}

} // namespace

// StompHeaders implementation
StompHeaders::StompHeaders(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void StompHeaders::set(const std::string& name, const std::string& value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = value;
            return;
        }
    }
    entries_.emplace_back(name, value);
}

std::string StompHeaders::get(const std::string& name, const std::string& defaultValue) const {
    for (const auto& [key, value] : entries_) {
        if (key == name) return value;
    }
    return defaultValue;
}

bool StompHeaders::has(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&name](const Entry& entry) { return entry.first == name; });
}

void StompHeaders::merge(const StompHeaders& other) {
    for (const auto& [key, value] : other) {
        set(key, value);
    }
}

bool StompHeaders::operator==(const StompHeaders& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, value] : entries_) {
        if (!other.has(key) || other.get(key) != value) return false;
    }
    return true;
}

// StompFrame implementation
StompFrame::StompFrame(const std::string& command,
                      const StompHeaders& headers,
                      const std::string& body)
    : command_(command), headers_(headers), body_(body) {
}

std::string StompFrame::text() const {
    std::string charset = charsetOf(headers_.get("content-type"));
    std::string normalized = toLower(charset);
    if (normalized.empty() || normalized == "utf-8" || normalized == "utf8") {
        return body_;
    }
    return decodeToUtf8(body_, charset);
}

std::unique_ptr<const StompFrame> StompFrame::parse(const std::string& frameData) {
    StompFrameParser parser;
    parser.process(frameData);
    return parser.takeFrame();
}

std::string StompFrame::serialize() const {
    std::ostringstream sb;
    sb << command_ << "\n";

    // Add headers
    for (const auto& [key, value] : headers_) {
        sb << key << ":" << value << "\n";
    }
    if (!body_.empty() && !headers_.has("content-length")) {
        sb << "content-length:" << body_.size() << "\n";
    }

    // Empty line separator
    sb << "\n";

    // Add body
    if (!body_.empty()) {
        sb << body_;
    }

    // Null terminator
    sb << '\0';

    return sb.str();
}

// Client-side frame builders
std::unique_ptr<StompFrame> StompFrame::connect(const std::string& login,
                                               const std::string& passcode,
                                               const StompHeaders& extraHeaders) {
    StompHeaders headers;
    headers.set("accept-version", "1.2");
    if (!login.empty()) headers.set("login", login);
    if (!passcode.empty()) headers.set("passcode", passcode);
    headers.merge(extraHeaders);

    return std::make_unique<StompFrame>("CONNECT", headers, "");
}

std::unique_ptr<StompFrame> StompFrame::subscribe(const std::string& destination,
                                                 const std::string& subscriptionId,
                                                 const std::string& ackMode) {
    StompHeaders headers;
    headers.set("destination", destination);
    headers.set("ack", ackMode);
    headers.set("id", subscriptionId);

    return std::make_unique<StompFrame>("SUBSCRIBE", headers, "");
}

std::unique_ptr<StompFrame> StompFrame::unsubscribe(const std::string& subscriptionId) {
    return std::make_unique<StompFrame>("UNSUBSCRIBE", StompHeaders{{"id", subscriptionId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::send(const std::string& destination,
                                            const std::string& body) {
    return std::make_unique<StompFrame>("SEND", StompHeaders{{"destination", destination}}, body);
}

std::unique_ptr<StompFrame> StompFrame::ack(const std::string& ackId) {
    return std::make_unique<StompFrame>("ACK", StompHeaders{{"id", ackId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::nack(const std::string& ackId) {
    return std::make_unique<StompFrame>("NACK", StompHeaders{{"id", ackId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::begin(const std::string& transactionId) {
    return std::make_unique<StompFrame>("BEGIN", StompHeaders{{"transaction", transactionId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::commit(const std::string& transactionId) {
    return std::make_unique<StompFrame>("COMMIT", StompHeaders{{"transaction", transactionId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::abort(const std::string& transactionId) {
    return std::make_unique<StompFrame>("ABORT", StompHeaders{{"transaction", transactionId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::disconnect() {
    return std::make_unique<StompFrame>("DISCONNECT", StompHeaders(), "");
}

// Server-side frame builders
std::unique_ptr<StompFrame> StompFrame::connected(const std::string& session) {
    StompHeaders headers;
    headers.set("version", "1.2");
    if (!session.empty()) headers.set("session", session);

    return std::make_unique<StompFrame>("CONNECTED", headers, "");
}

std::unique_ptr<StompFrame> StompFrame::receipt(const std::string& receiptId) {
    return std::make_unique<StompFrame>("RECEIPT", StompHeaders{{"receipt-id", receiptId}}, "");
}

std::unique_ptr<StompFrame> StompFrame::message(const std::string& destination,
                                               const std::string& messageId,
                                               const std::string& subscription,
                                               const std::string& body) {
    StompHeaders headers;
    headers.set("destination", destination);
    headers.set("message-id", messageId);
    headers.set("subscription", subscription);

    return std::make_unique<StompFrame>("MESSAGE", headers, body);
}

std::unique_ptr<StompFrame> StompFrame::error(const std::string& message,
                                             const std::string& details) {
    return std::make_unique<StompFrame>("ERROR", StompHeaders{{"message", message}}, details);
}

std::string StompFrame::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

// StompFrameParser implementation
std::string StompFrameParser::process(const std::string& data) {
    size_t pos = 0;
    std::string line;

    while (pos < data.size() && state_ != State::Complete) {
        switch (state_) {
        case State::AwaitCommand:
            if (readLine(data, pos, line)) {
                line = StompFrame::trim(line);
                // Blank lines ahead of a command are heart-beats
                if (!line.empty()) {
                    command_ = line;
                    state_ = State::ReadingHeaders;
                }
            }
            break;

        case State::ReadingHeaders:
            if (readLine(data, pos, line)) {
                line = StompFrame::trim(line);
                if (line.empty()) {
                    finishHeaders();
                } else {
                    parseHeaderLine(line);
                }
            }
            break;

        case State::ReadingBody:
            if (lengthFixed_) {
                if (remainingBodyBytes_ > 0) {
                    size_t count = std::min(remainingBodyBytes_, data.size() - pos);
                    body_.append(data, pos, count);
                    pos += count;
                    remainingBodyBytes_ -= count;
                } else {
                    if (data[pos] != '\0') {
                        throw StompFrameError("body longer than content-length");
                    }
                    ++pos;
                    finishFrame();
                }
            } else {
                size_t terminator = data.find('\0', pos);
                if (terminator == std::string::npos) {
                    body_.append(data, pos, std::string::npos);
                    pos = data.size();
                } else {
                    body_.append(data, pos, terminator - pos);
                    pos = terminator + 1;
                    finishFrame();
                }
            }
            break;

        case State::Complete:
            break;
        }
    }

    return data.substr(pos);
}

bool StompFrameParser::hasPartialFrame() const {
    if (state_ == State::Complete) return false;
    return state_ != State::AwaitCommand || !StompFrame::trim(pendingLine_).empty();
}

std::unique_ptr<const StompFrame> StompFrameParser::takeFrame() {
    return std::move(frame_);
}

bool StompFrameParser::readLine(const std::string& data, size_t& pos, std::string& line) {
    size_t newline = data.find('\n', pos);
    if (newline == std::string::npos) {
        pendingLine_.append(data, pos, std::string::npos);
        pos = data.size();
        return false;
    }

    line = pendingLine_;
    line.append(data, pos, newline - pos);
    pendingLine_.clear();
    pos = newline + 1;
    return true;
}

void StompFrameParser::parseHeaderLine(const std::string& line) {
    size_t colonPos = line.find(':');
    if (colonPos == std::string::npos) {
        throw StompFrameError("header line without ':' in " + command_ + " frame: " + line);
    }
    headers_.set(line.substr(0, colonPos), line.substr(colonPos + 1));
}

void StompFrameParser::finishHeaders() {
    if (headers_.has("content-length")) {
        std::string length = StompFrame::trim(headers_.get("content-length"));
        if (length.empty() || !std::all_of(length.begin(), length.end(),
                                           [](unsigned char c) { return std::isdigit(c); })) {
            throw StompFrameError("invalid content-length '" + length + "'");
        }
        try {
            remainingBodyBytes_ = std::stoul(length);
        } catch (const std::out_of_range&) {
            throw StompFrameError("content-length out of range '" + length + "'");
        }
        lengthFixed_ = true;
    }
    state_ = State::ReadingBody;
}

void StompFrameParser::finishFrame() {
    frame_ = std::make_unique<StompFrame>(command_, headers_, body_);
    state_ = State::Complete;
}
