#include "StompClient.hpp"
#include "StompErrors.hpp"

StompTransaction::StompTransaction(StompClient* client, const std::string& transactionId,
                                   std::shared_ptr<StompReceipt> beginReceipt)
    : client_(client), transactionId_(transactionId), beginReceipt_(std::move(beginReceipt)) {
}

std::shared_ptr<StompReceipt> StompTransaction::send(const std::string& command,
                                                     const StompHeaders& headers,
                                                     const std::string& body,
                                                     const StompReceiptRequest& receipt) {
    checkOpen();
    return client_->send(command, headers, body, transactionId_, receipt);
}

std::shared_ptr<StompReceipt> StompTransaction::message(const std::string& destination,
                                                        const std::string& body,
                                                        const std::string& messageId,
                                                        const StompHeaders& headers,
                                                        const StompReceiptRequest& receipt) {
    checkOpen();
    return client_->message(destination, body, messageId, headers, receipt, transactionId_);
}

// ACKs sent automatically for this frame are part of the transaction
std::unique_ptr<const StompFrame> StompTransaction::recv(std::chrono::milliseconds timeout) {
    checkOpen();
    return client_->recv(transactionId_, timeout);
}

void StompTransaction::ack(const std::string& ackId) {
    checkOpen();
    client_->ack(ackId, transactionId_);
}

void StompTransaction::nack(const std::string& ackId) {
    checkOpen();
    client_->nack(ackId, transactionId_);
}

std::shared_ptr<StompReceipt> StompTransaction::commit(const StompReceiptRequest& receipt) {
    checkOpen();
    auto commitFrame = StompFrame::commit(transactionId_);
    auto out = client_->transmit(*commitFrame, "", receipt);
    closed_ = true;
    return out;
}

std::shared_ptr<StompReceipt> StompTransaction::abort(const StompReceiptRequest& receipt) {
    checkOpen();
    auto abortFrame = StompFrame::abort(transactionId_);
    auto out = client_->transmit(*abortFrame, "", receipt);
    closed_ = true;
    return out;
}

void StompTransaction::checkOpen() const {
    if (closed_) {
        throw StompTransactionClosedError(transactionId_);
    }
}
