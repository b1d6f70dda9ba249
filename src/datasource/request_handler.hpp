#pragma once

#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "datasource/reply.hpp"
#include "datasource/request.hpp"

namespace datasource {

using handlerCallback = std::function<void(const Request &req, Reply &rep)>;

class RequestHandler {
   public:
    RequestHandler(const RequestHandler &) = delete;
    RequestHandler &operator=(const RequestHandler &) = delete;

    explicit RequestHandler(size_t maxContentSize);
    ~RequestHandler() = default;

    // Handlers are tried in the order they were added. The first one that
    // sends a reply wins.
    void addRequestHandler(const handlerCallback &cb);

    void handleRequest(unsigned connectionId, const Request &req, Reply &rep);

    // Pull the next part of a streamed reply body into rep.content_.
    void handleStreamingRead(unsigned connectionId, Reply &rep);

   private:
    // The max buffer size when writing socket.
    const size_t maxContentSize_;

    // Added request handler callbacks
    std::deque<handlerCallback> requestHandlers_;
};

}  // namespace datasource
