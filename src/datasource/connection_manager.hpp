#pragma once

#include <chrono>
#include <memory>
#include <set>
#include <string>

#include "datasource/connection.hpp"
#include "datasource/datasource_common.hpp"

namespace datasource {

// Manages open connections so that they may be cleanly stopped when the server
// needs to shut down.
class ConnectionManager {
   public:
    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Construct a connection manager.
    ConnectionManager(const Settings &settings);
    ~ConnectionManager() = default;

    // Add the specified connection to the manager and start it.
    void start(std::shared_ptr<Connection> c);

    // Stop the specified connection.
    void stop(std::shared_ptr<Connection> c);

    // Stop all connections.
    void stopAll();

    // Enforce keep-alive timeout and max requests. Called periodically.
    void tick();

    size_t size() const {
        return connections_.size();
    }

    // Handler for debug messages.
    void setDebugMsgHandler(const debugMsgCallback &cb);

    // Connections may use the debug message handler.
    void debugMsg(const std::string &msg);

   private:
    // The managed connections.
    std::set<std::shared_ptr<Connection>> connections_;

    // Settings for connections.
    const Settings &settings_;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;
};

}  // namespace datasource
