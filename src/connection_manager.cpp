#include <chrono>

#include "datasource/connection_manager.hpp"

namespace {
void defaultDebugMsgHandler(const std::string &) {}
}  // namespace

namespace datasource {

ConnectionManager::ConnectionManager(const Settings &settings)
    : settings_(settings), debugMsgCb_(defaultDebugMsgHandler) {}

void ConnectionManager::start(std::shared_ptr<Connection> c) {
    connections_.insert(c);
    bool useKeepAlive = false;
    if (settings_.keepAliveTimeout_ != std::chrono::seconds(0) &&
        (settings_.connectionLimit_ == 0 ||  // 0 = unlimited
         connections_.size() <= settings_.connectionLimit_)) {
        useKeepAlive = true;
    }
    c->start(useKeepAlive, settings_.keepAliveTimeout_, settings_.keepAliveMax_);
}

void ConnectionManager::stop(std::shared_ptr<Connection> c) {
    connections_.erase(c);
    c->stop();
}

void ConnectionManager::stopAll() {
    for (auto c : connections_) {
        c->stop();
    }
    connections_.clear();
}

void ConnectionManager::tick() {
    auto now = std::chrono::steady_clock::now();
    auto it = connections_.begin();
    while (it != connections_.end()) {
        // a reply still being streamed is never cut off
        if (!(*it)->useKeepAlive() || (*it)->isWriteInProgress()) {
            it++;
            continue;
        }

        bool erase = false;
        if ((*it)->getLastActivityTime() + settings_.keepAliveTimeout_ < now) {
            debugMsgCb_("Removing HTTP connection " + std::to_string((*it)->getConnectionId()) +
                        " due to inactivity");
            erase = true;
        } else if ((*it)->getNrOfRequests() >= settings_.keepAliveMax_) {
            debugMsgCb_("Removing HTTP connection " + std::to_string((*it)->getConnectionId()) +
                        " due to max request limit");
            erase = true;
        }

        if (erase) {
            (*it)->stop();
            it = connections_.erase(it);
        } else {
            it++;
        }
    }
}

void ConnectionManager::setDebugMsgHandler(const debugMsgCallback &cb) {
    debugMsgCb_ = cb;
}

void ConnectionManager::debugMsg(const std::string &msg) {
    debugMsgCb_(msg);
}

}  // namespace datasource
