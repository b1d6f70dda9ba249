#pragma once

#include <asio.hpp>
#include <memory>
#include <string>

#include "datasource/connection.hpp"
#include "datasource/connection_manager.hpp"
#include "datasource/datasource_common.hpp"
#include "datasource/request_handler.hpp"

namespace datasource {

// Minimum and default size of the per connection socket buffers.
const size_t kMinContentSize = 1024;

class Server {
   public:
    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Listen on all IPv4 interfaces. Port 0 picks a free port, see
    // getBindedPort().
    explicit Server(asio::io_context &ioContext,
                    uint16_t port,
                    Settings settings = Settings(),
                    size_t maxContentSize = kMinContentSize);

    // Listen on 'address' and stop on SIGINT/SIGTERM. Throws
    // std::system_error if the address cannot be resolved or bound.
    explicit Server(asio::io_context &ioContext,
                    const std::string &address,
                    const std::string &port,
                    Settings settings = Settings(),
                    size_t maxContentSize = kMinContentSize);
    ~Server() = default;

    uint16_t getBindedPort() const;

    void addRequestHandler(const handlerCallback &cb);
    void setDebugMsgHandler(const debugMsgCallback &cb);

    // Stop accepting and close all connections.
    void stop();

   private:
    void doAccept();
    void doAwaitStop();
    void doTick();

    std::shared_ptr<asio::signal_set> signals_;
    asio::ip::tcp::acceptor acceptor_;

    // Settings for connections, referenced by the connection manager.
    const Settings settings_;

    ConnectionManager connectionManager_;
    RequestHandler requestHandler_;

    // Unique Id for each connection.
    unsigned connectionId_ = 0;

    // Timer to handle connection status.
    asio::steady_timer timer_;

    // The max buffer size when reading/writing socket.
    const size_t maxContentSize_;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;

    // Runs request handlers and body reads off the I/O thread. Declared last
    // so it is joined before the members the handlers use go away.
    asio::thread_pool workers_;
};

}  // namespace datasource
