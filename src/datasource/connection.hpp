#pragma once

#include <asio.hpp>
#include <chrono>
#include <memory>
#include <vector>

#include "datasource/reply.hpp"
#include "datasource/request.hpp"
#include "datasource/request_decoder.hpp"
#include "datasource/request_handler.hpp"
#include "datasource/request_parser.hpp"

namespace datasource {

class ConnectionManager;

// Represents a single connection from a client.
class Connection : public std::enable_shared_from_this<Connection> {
   public:
    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Construct a connection with the given socket.
    explicit Connection(asio::ip::tcp::socket socket,
                        ConnectionManager &manager,
                        RequestHandler &handler,
                        asio::thread_pool &workers,
                        unsigned connectionId,
                        size_t maxContentSize);
    ~Connection() = default;

    // Start the first asynchronous operation for the connection.
    void start(bool useKeepAlive, std::chrono::seconds keepAliveTimeout, size_t keepAliveMax);

    // Stop all asynchronous operations associated with the connection.
    void stop();

    std::chrono::steady_clock::time_point getLastActivityTime() const;
    size_t getNrOfRequests() const;
    bool useKeepAlive() const;
    unsigned getConnectionId() const;

    // True from a complete request until its reply is written.
    bool isWriteInProgress() const;

   private:
    // Perform an asynchronous read operation.
    void doRead();

    // Run the request handlers on a worker thread, then write the reply.
    void doHandleRequest();

    // Perform an asynchronous write operation.
    void doWriteHeaders();
    void doWriteReplyContent();

    // Pull the next body part on a worker thread, then write it.
    void doReadNextPart();

    void handleConnection();
    void handleWriteCompleted();

    void shutdown();

    // Socket for the connection.
    asio::ip::tcp::socket socket_;

    // The manager for this connection.
    ConnectionManager &connectionManager_;

    // The handler used to process the incoming request.
    RequestHandler &requestHandler_;

    // Where handlers and stream reads run. They may block on disk or network.
    asio::thread_pool &workers_;

    // The unique id for the connection.
    unsigned connectionId_;

    // The max buffer size when reading/writing socket.
    size_t maxContentSize_;

    // Buffer for incoming data.
    std::vector<char> recvBuffer_;

    // Buffer for outgoing data.
    std::vector<char> sendBuffer_;

    // The incoming request.
    Request request_;

    // The parser for the incoming request.
    RequestParser requestParser_;

    // The decoder for the incoming request.
    RequestDecoder requestDecoder_;

    // The reply to be sent back to the client.
    Reply reply_;

    // Last connection activity timestamp.
    std::chrono::steady_clock::time_point lastActivityTime_;

    // Number of seconds to keep connection open during inactivity.
    std::chrono::seconds keepAliveTimeout_;

    // Support keep-alive or not.
    bool useKeepAlive_ = false;

    // Max requests that can be made on the connection.
    size_t keepAliveMax_ = 0;

    // Request counter
    size_t nrOfRequest_ = 0;

    bool closeConnection_ = false;

    bool writeInProgress_ = false;
};

}  // namespace datasource
