#pragma once

#include <asio.hpp>
#include <cctype>
#include <functional>
#include <string>
#include <vector>

#include "datasource/header.hpp"
#include "datasource/request.hpp"

namespace datasource {

// Callback function for streaming data - returns number of bytes written to
// buffer, 0 for end of stream and negative on failure.
typedef std::function<int(const std::string &id, char *buf, size_t maxSize)> StreamCallback;

class RequestHandler;

class Reply {
    friend class RequestHandler;
    friend class Connection;

   public:
    Reply(const Reply &) = delete;
    Reply &operator=(const Reply &) = delete;

    Reply(std::vector<char> &content);
    virtual ~Reply() = default;

    enum status_type {
        ok = 200,
        no_content = 204,
        partial_content = 206,
        moved_permanently = 301,
        moved_temporarily = 302,
        not_modified = 304,
        bad_request = 400,
        forbidden = 403,
        not_found = 404,
        method_not_allowed = 405,
        length_required = 411,
        payload_too_large = 413,
        range_not_satisfiable = 416,
        internal_server_error = 500,
        not_implemented = 501,
        bad_gateway = 502,
        service_unavailable = 503,
        version_not_supported = 505
    };

    // Content to be sent in the reply.
    std::vector<char> &content_;

    // Reply with content_ as body, or no body at all.
    void send(status_type status);
    void send(status_type status, const std::string &contentType);

    // Reply with a body of known size pulled from 'callback' in parts of at
    // most the server's buffer size. A null callback sends the headers only.
    void sendBig(status_type status,
                 const std::string &contentType,
                 size_t totalSize,
                 StreamCallback callback);

    // Reply with a body of unknown size using chunked transfer coding.
    void sendStreaming(status_type status, const std::string &contentType, StreamCallback callback);

    void addHeader(const std::string &name, const std::string &val);

    // e.g. "Not Found" for not_found.
    static const char *reasonPhrase(status_type status);

// Test-only interface - enable to access private members for e.g. unit test of handlers.
#ifdef DATASOURCE_ENABLE_TESTING
    status_type getStatus() const {
        return status_;
    }

    const std::vector<Header> &getHeaders() const {
        return headers_;
    }

    static bool iequals(const std::string &a, const std::string &b) {
        if (a.size() != b.size()) {
            return false;
        }

        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }

    std::string getHeaderValue(const std::string &headerName) const {
        for (const auto &header : headers_) {
            if (iequals(header.name_, headerName)) {
                return header.value_;
            }
        }
        return "";
    }

    bool isReturnedToClient() const {
        return returnToClient_;
    }

    bool hasStream() const {
        return static_cast<bool>(streamCallback_);
    }

    // Drain the stream callback like the connection would.
    std::string drainStreamForTest(size_t partSize = 1024) {
        std::string body;
        std::vector<char> buf(partSize);
        while (streamCallback_) {
            int bytesRead = streamCallback_("test", buf.data(), buf.size());
            if (bytesRead <= 0) {
                break;
            }
            body.append(buf.data(), bytesRead);
        }
        return body;
    }

    void resetForTest() {
        reset();
    }
#endif

   private:
    void reset() {
        content_.clear();
        headers_.clear();
        status_ = ok;
        returnToClient_ = false;
        finalPart_ = false;
        streamFailed_ = false;
        streamCallback_ = nullptr;
        totalStreamSize_ = 0;
        streamedBytes_ = 0;
        useChunkedEncoding_ = false;
    }

    // Helper to provide standard server replies.
    void stockReply(const Request &req, status_type status);

    // Check if the status code is in the 200 range.
    bool isStatusOk() const {
        return status_ == ok || status_ == no_content || status_ == partial_content;
    }

    // The status code of the reply.
    status_type status_;

    // Headers to be included in the reply.
    std::vector<Header> headers_;

    // Set to true when the reply is ready to be sent to the client.
    bool returnToClient_ = false;

    // Keep track when replying with successive write buffers.
    bool finalPart_ = false;

    // Set when the stream callback failed or ended before totalStreamSize_.
    bool streamFailed_ = false;

    // Streaming support for large data/streaming responses
    StreamCallback streamCallback_ = nullptr;
    size_t totalStreamSize_ = 0;
    size_t streamedBytes_ = 0;
    bool useChunkedEncoding_ = false;

    // Helper methods for chunked transfer encoding
    void wrapContentInChunkFormat();
    std::string toHexString(size_t value);

    // Convert the reply into a vector of buffers. The buffers do not own the
    // underlying memory blocks, therefore the reply object must remain valid
    // and not be changed until the write operation has completed.
    std::vector<asio::const_buffer> headerToBuffers();
    std::vector<asio::const_buffer> contentToBuffers();
};

}  // namespace datasource
