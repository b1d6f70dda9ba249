#include <strings.h>

#include <algorithm>

#include "datasource/connection.hpp"
#include "datasource/connection_manager.hpp"

namespace datasource {

Connection::Connection(asio::ip::tcp::socket socket,
                       ConnectionManager &manager,
                       RequestHandler &handler,
                       asio::thread_pool &workers,
                       unsigned connectionId,
                       size_t maxContentSize)
    : socket_(std::move(socket)),
      connectionManager_(manager),
      requestHandler_(handler),
      workers_(workers),
      connectionId_(connectionId),
      maxContentSize_(maxContentSize),
      recvBuffer_(maxContentSize),
      sendBuffer_(),
      request_(recvBuffer_),
      reply_(sendBuffer_) {
    sendBuffer_.reserve(maxContentSize);
}

void Connection::start(bool useKeepAlive,
                       std::chrono::seconds keepAliveTimeout,
                       size_t keepAliveMax) {
    lastActivityTime_ = std::chrono::steady_clock::now();
    useKeepAlive_ = useKeepAlive;
    keepAliveTimeout_ = keepAliveTimeout;
    keepAliveMax_ = keepAliveMax;
    doRead();
}

void Connection::stop() {
    std::error_code ignored_ec;
    socket_.close(ignored_ec);
}

std::chrono::steady_clock::time_point Connection::getLastActivityTime() const {
    return lastActivityTime_;
}

size_t Connection::getNrOfRequests() const {
    return nrOfRequest_;
}

bool Connection::useKeepAlive() const {
    return (useKeepAlive_ && request_.keepAlive_);
}

unsigned Connection::getConnectionId() const {
    return connectionId_;
}

bool Connection::isWriteInProgress() const {
    return writeInProgress_;
}

void Connection::doRead() {
    auto self(shared_from_this());
    // Asio uses recvBuffer_.size() to limit amount of read data so must restore
    // size before reading. Note: operation is "cheap" as maxContentSize is
    // already reserved.
    recvBuffer_.resize(maxContentSize_);
    socket_.async_read_some(
        asio::buffer(recvBuffer_), [this, self](std::error_code ec, std::size_t bytesTransferred) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();
                recvBuffer_.resize(bytesTransferred);

                RequestParser::result_type result =
                    requestParser_.parse(request_, recvBuffer_, maxContentSize_);

                if (result == RequestParser::good_complete) {
                    doHandleRequest();
                } else if (result == RequestParser::missing_content_length) {
                    reply_.stockReply(request_, Reply::length_required);
                    doWriteHeaders();
                } else if (result == RequestParser::payload_too_large) {
                    reply_.stockReply(request_, Reply::payload_too_large);
                    doWriteHeaders();
                } else if (result == RequestParser::version_not_supported) {
                    reply_.stockReply(request_, Reply::version_not_supported);
                    doWriteHeaders();
                } else if (result == RequestParser::bad) {
                    reply_.stockReply(request_, Reply::bad_request);
                    doWriteHeaders();
                } else {
                    doRead();
                }
            } else if (ec != asio::error::operation_aborted) {
                if (ec != asio::error::eof) {
                    connectionManager_.debugMsg("doRead: " + ec.message() + ':' +
                                                std::to_string(ec.value()));
                }
                connectionManager_.stop(shared_from_this());
            }
        });
}

void Connection::doHandleRequest() {
    // The worker owns request_ and reply_ until it posts back. The socket is
    // only touched from the I/O thread.
    writeInProgress_ = true;
    auto self(shared_from_this());
    auto ioExecutor = socket_.get_executor();
    asio::post(workers_, [this, self, ioExecutor]() {
        if (requestDecoder_.decodeRequest(request_)) {
            requestHandler_.handleRequest(connectionId_, request_, reply_);
        } else {
            reply_.stockReply(request_, Reply::bad_request);
        }
        asio::post(ioExecutor, [this, self]() { doWriteHeaders(); });
    });
}

void Connection::doWriteHeaders() {
    handleConnection();
    writeInProgress_ = true;
    auto self(shared_from_this());
    asio::async_write(
        socket_, reply_.headerToBuffers(), [this, self](std::error_code ec, std::size_t) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();

                if (!reply_.content_.empty()) {
                    doWriteReplyContent();
                } else if (reply_.streamFailed_) {
                    connectionManager_.debugMsg("doWriteHeaders: reply stream failed");
                    shutdown();
                } else {
                    handleWriteCompleted();
                }
            } else {
                connectionManager_.debugMsg("doWriteHeaders: " + ec.message() + ':' +
                                            std::to_string(ec.value()));
                shutdown();
            }
        });
}

void Connection::doWriteReplyContent() {
    auto self(shared_from_this());
    asio::async_write(
        socket_, reply_.contentToBuffers(), [this, self](std::error_code ec, std::size_t) {
            if (!ec) {
                lastActivityTime_ = std::chrono::steady_clock::now();

                if (reply_.streamCallback_ && !reply_.finalPart_) {
                    doReadNextPart();
                    return;
                }
                handleWriteCompleted();
            } else {
                connectionManager_.debugMsg("doWriteReplyContent: " + ec.message() + ':' +
                                            std::to_string(ec.value()));
                shutdown();
            }
        });
}

void Connection::doReadNextPart() {
    auto self(shared_from_this());
    auto ioExecutor = socket_.get_executor();
    asio::post(workers_, [this, self, ioExecutor]() {
        requestHandler_.handleStreamingRead(connectionId_, reply_);
        asio::post(ioExecutor, [this, self]() {
            if (reply_.streamFailed_) {
                // The client can tell from the short body, nothing else to do
                // than closing.
                connectionManager_.debugMsg("doReadNextPart: reply stream failed");
                shutdown();
            } else if (!reply_.content_.empty()) {
                doWriteReplyContent();
            } else {
                handleWriteCompleted();
            }
        });
    });
}

void Connection::handleConnection() {
    nrOfRequest_++;

    // Check if server wants to close the connection
    auto it = std::find_if(reply_.headers_.begin(), reply_.headers_.end(), [](const Header &h) {
        return strcasecmp(h.name_.c_str(), "Connection") == 0 &&
               strcasecmp(h.value_.c_str(), "close") == 0;
    });
    if (it != reply_.headers_.end()) {
        closeConnection_ = true;
        return;
    }

    // Check if client wants to close the connection
    if (request_.keepAlive_ == false) {
        reply_.addHeader("Connection", "close");
        closeConnection_ = true;
        return;
    }

    // Check if we should use keep-alive
    if (useKeepAlive_ && nrOfRequest_ < keepAliveMax_) {
        reply_.addHeader("Connection", "keep-alive");
        reply_.addHeader("Keep-Alive",
                         "timeout=" + std::to_string(keepAliveTimeout_.count()) +
                             ", max=" + std::to_string(keepAliveMax_));
        return;
    }

    // Default in HTTP/1.1 is keep-alive, but if server does not want to use
    // it, we must close the connection here
    reply_.addHeader("Connection", "close");
    closeConnection_ = true;
}

void Connection::handleWriteCompleted() {
    writeInProgress_ = false;
    requestParser_.reset();
    request_.reset();
    reply_.reset();

    if (!closeConnection_) {
        doRead();
    } else {
        // Initiate graceful connection closure
        std::error_code ignored_ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored_ec);
        connectionManager_.stop(shared_from_this());
    }
}

void Connection::shutdown() {
    // Initiate graceful connection closure
    writeInProgress_ = false;
    std::error_code ignored_ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored_ec);
    connectionManager_.stop(shared_from_this());
}

}  // namespace datasource
