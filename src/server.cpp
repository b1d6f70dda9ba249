#include <signal.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include "datasource/server.hpp"

namespace {
void defaultDebugMsgHandler(const std::string &) {}
}  // namespace

namespace datasource {

Server::Server(asio::io_context &ioContext,
               uint16_t port,
               Settings settings,
               size_t maxContentSize)
    : acceptor_(ioContext, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port)),
      settings_(settings),
      connectionManager_(settings_),
      requestHandler_(std::max(maxContentSize, kMinContentSize)),
      timer_(ioContext),
      maxContentSize_(std::max(maxContentSize, kMinContentSize)),
      debugMsgCb_(defaultDebugMsgHandler),
      workers_(std::max<size_t>(settings.workerThreads_, 1)) {
    doAccept();
    doTick();
}

Server::Server(asio::io_context &ioContext,
               const std::string &address,
               const std::string &port,
               Settings settings,
               size_t maxContentSize)
    : acceptor_(ioContext),
      settings_(settings),
      connectionManager_(settings_),
      requestHandler_(std::max(maxContentSize, kMinContentSize)),
      timer_(ioContext),
      maxContentSize_(std::max(maxContentSize, kMinContentSize)),
      debugMsgCb_(defaultDebugMsgHandler),
      workers_(std::max<size_t>(settings.workerThreads_, 1)) {
    // Register to handle the signals that indicate when the server should exit.
    // It is safe to register for the same signal multiple times in a program,
    // provided all registration for the specified signal is made through Asio.
    signals_ = std::make_shared<asio::signal_set>(ioContext);
    signals_->add(SIGINT);
    signals_->add(SIGTERM);
#if defined(SIGQUIT)
    signals_->add(SIGQUIT);
#endif  // defined(SIGQUIT)

    doAwaitStop();

    // Open the acceptor with the option to reuse the address (i.e.
    // SO_REUSEADDR).
    asio::ip::tcp::resolver resolver(ioContext);
    asio::ip::tcp::endpoint endpoint = *resolver.resolve(address, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();

    doAccept();
    doTick();
}

uint16_t Server::getBindedPort() const {
    return acceptor_.local_endpoint().port();
}

void Server::addRequestHandler(const handlerCallback &cb) {
    requestHandler_.addRequestHandler(cb);
}

void Server::setDebugMsgHandler(const debugMsgCallback &cb) {
    connectionManager_.setDebugMsgHandler(cb);
    debugMsgCb_ = cb;
}

void Server::stop() {
    timer_.cancel();
    if (signals_) {
        std::error_code ignored_ec;
        signals_->cancel(ignored_ec);
    }
    std::error_code ignored_ec;
    acceptor_.close(ignored_ec);
    connectionManager_.stopAll();
}

void Server::doAccept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket) {
        // Check whether the server was stopped by a signal before this
        // completion handler had a chance to run.
        if (!acceptor_.is_open()) {
            return;
        }

        if (!ec) {
            connectionManager_.start(std::make_shared<Connection>(std::move(socket),
                                                                  connectionManager_,
                                                                  requestHandler_,
                                                                  workers_,
                                                                  connectionId_++,
                                                                  maxContentSize_));
        } else {
            debugMsgCb_("doAccept: " + ec.message() + ":" + std::to_string(ec.value()));
        }

        doAccept();
    });
}

void Server::doAwaitStop() {
    signals_->async_wait([this](std::error_code ec, int signo) {
        if (ec) {
            return;
        }
        debugMsgCb_("Stopping on signal " + std::to_string(signo));
        stop();
    });
}

void Server::doTick() {
    timer_.expires_after(std::chrono::seconds(1));
    timer_.async_wait([this](std::error_code ec) {
        if (!ec) {
            connectionManager_.tick();

            doTick();
        }
    });
}

}  // namespace datasource
