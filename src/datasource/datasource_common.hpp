#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace datasource {

using debugMsgCallback = std::function<void(const std::string &msg)>;

const size_t kDefaultWorkerThreads = 4;
const size_t kMaxWorkerThreads = 256;

struct Settings {
    Settings(std::chrono::seconds keepAliveTimeout = std::chrono::seconds(5),
             size_t keepAliveMax = 100,
             size_t connectionLimit = 0,
             size_t workerThreads = kDefaultWorkerThreads)
        : keepAliveTimeout_(keepAliveTimeout),
          keepAliveMax_(keepAliveMax),
          connectionLimit_(connectionLimit),
          workerThreads_(workerThreads) {}

    // Keep-Alive timeout for inactive connections. Sent in Keep-Alive response header.
    // 0s = Keep-Alive disabled.
    std::chrono::seconds keepAliveTimeout_;

    // Max number of request that can be processed on the connection before it is closed.
    // Sent in Keep-Alive response header.
    size_t keepAliveMax_;

    // Internal limitation of the number of persistent http connections
    // that are allowed. If this limit is exceeded, Connection=close will be
    // sent in the response for new connections.
    // 0 = no limit.
    size_t connectionLimit_;

    // Threads running request handlers and body reads, so that a slow fetch
    // never stalls the socket I/O of other connections. At least 1.
    size_t workerThreads_;
};

}  // namespace datasource
