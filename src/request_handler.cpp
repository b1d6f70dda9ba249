#include <string>

#include "datasource/request_handler.hpp"

namespace datasource {

RequestHandler::RequestHandler(size_t maxContentSize) : maxContentSize_(maxContentSize) {}

void RequestHandler::addRequestHandler(const handlerCallback &cb) {
    requestHandlers_.push_back(cb);
}

void RequestHandler::handleRequest(unsigned connectionId, const Request &req, Reply &rep) {
    for (const auto &requestHandler : requestHandlers_) {
        requestHandler(req, rep);
        if (rep.returnToClient_) {
            if (req.method_ == "HEAD") {
                rep.content_.clear();
                rep.streamCallback_ = nullptr;
                rep.finalPart_ = true;
            } else if (rep.streamCallback_) {
                // fill the first part so it goes out right after the headers
                handleStreamingRead(connectionId, rep);
                if (rep.streamFailed_ && rep.streamedBytes_ == 0) {
                    // nothing sent yet, a proper error reply is still possible
                    rep.stockReply(req, Reply::internal_server_error);
                }
            }
            return;
        }
    }

    rep.stockReply(req, Reply::not_found);
}

void RequestHandler::handleStreamingRead(unsigned connectionId, Reply &rep) {
    if (!rep.streamCallback_ || rep.finalPart_) {
        rep.content_.clear();
        return;
    }

    // Calculate safe buffer size for chunked encoding
    size_t callbackBufferSize = maxContentSize_;
    if (rep.useChunkedEncoding_) {
        // For practical use, assume max 6 hex digits: "100000\r\n" + "\r\n" + trailer = 12
        // bytes. The min size allowed for maxContentSize_ is 1024 so this is safe.
        const size_t maxChunkOverhead = 12;
        callbackBufferSize = maxContentSize_ - maxChunkOverhead;
    } else if (rep.totalStreamSize_ - rep.streamedBytes_ < callbackBufferSize) {
        callbackBufferSize = rep.totalStreamSize_ - rep.streamedBytes_;
    }

    rep.content_.resize(callbackBufferSize);
    int bytesRead =
        rep.streamCallback_(std::to_string(connectionId), rep.content_.data(), callbackBufferSize);

    if (bytesRead > 0 && static_cast<size_t>(bytesRead) <= callbackBufferSize) {
        rep.content_.resize(bytesRead);
        rep.streamedBytes_ += bytesRead;

        if (rep.useChunkedEncoding_) {
            rep.wrapContentInChunkFormat();
            // final part is set when the callback reports end of stream
        } else {
            rep.finalPart_ = rep.streamedBytes_ >= rep.totalStreamSize_;
        }
    } else if (bytesRead == 0 && rep.useChunkedEncoding_) {
        // Send final chunk "0\r\n\r\n"
        rep.finalPart_ = true;
        rep.content_.clear();
        rep.wrapContentInChunkFormat();
    } else {
        // Failure, or end of stream before the announced Content-Length. The
        // headers may already be on the wire so the connection must be closed.
        rep.finalPart_ = true;
        rep.streamFailed_ = true;
        rep.content_.clear();
    }
}

}  // namespace datasource
