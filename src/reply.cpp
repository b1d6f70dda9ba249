#include <string>

#include "datasource/reply.hpp"

namespace datasource {

namespace status_strings {

const std::string ok = "HTTP/1.1 200 OK\r\n";
const std::string no_content = "HTTP/1.1 204 No Content\r\n";
const std::string partial_content = "HTTP/1.1 206 Partial Content\r\n";
const std::string moved_permanently = "HTTP/1.1 301 Moved Permanently\r\n";
const std::string moved_temporarily = "HTTP/1.1 302 Moved Temporarily\r\n";
const std::string not_modified = "HTTP/1.1 304 Not Modified\r\n";
const std::string bad_request = "HTTP/1.1 400 Bad Request\r\n";
const std::string forbidden = "HTTP/1.1 403 Forbidden\r\n";
const std::string not_found = "HTTP/1.1 404 Not Found\r\n";
const std::string method_not_allowed = "HTTP/1.1 405 Method Not Allowed\r\n";
const std::string length_required = "HTTP/1.1 411 Length Required\r\n";
const std::string payload_too_large = "HTTP/1.1 413 Payload Too Large\r\n";
const std::string range_not_satisfiable = "HTTP/1.1 416 Range Not Satisfiable\r\n";
const std::string internal_server_error = "HTTP/1.1 500 Internal Server Error\r\n";
const std::string not_implemented = "HTTP/1.1 501 Not Implemented\r\n";
const std::string bad_gateway = "HTTP/1.1 502 Bad Gateway\r\n";
const std::string service_unavailable = "HTTP/1.1 503 Service Unavailable\r\n";
const std::string version_not_supported = "HTTP/1.1 505 Version Not Supported\r\n";

asio::const_buffer toBuffer(Reply::status_type status) {
    switch (status) {
        case Reply::ok:
            return asio::buffer(ok);
        case Reply::no_content:
            return asio::buffer(no_content);
        case Reply::partial_content:
            return asio::buffer(partial_content);
        case Reply::moved_permanently:
            return asio::buffer(moved_permanently);
        case Reply::moved_temporarily:
            return asio::buffer(moved_temporarily);
        case Reply::not_modified:
            return asio::buffer(not_modified);
        case Reply::bad_request:
            return asio::buffer(bad_request);
        case Reply::forbidden:
            return asio::buffer(forbidden);
        case Reply::not_found:
            return asio::buffer(not_found);
        case Reply::method_not_allowed:
            return asio::buffer(method_not_allowed);
        case Reply::length_required:
            return asio::buffer(length_required);
        case Reply::payload_too_large:
            return asio::buffer(payload_too_large);
        case Reply::range_not_satisfiable:
            return asio::buffer(range_not_satisfiable);
        case Reply::internal_server_error:
            return asio::buffer(internal_server_error);
        case Reply::not_implemented:
            return asio::buffer(not_implemented);
        case Reply::bad_gateway:
            return asio::buffer(bad_gateway);
        case Reply::service_unavailable:
            return asio::buffer(service_unavailable);
        case Reply::version_not_supported:
            return asio::buffer(version_not_supported);
        default:
            return asio::buffer(internal_server_error);
    }
}

const char *toReason(Reply::status_type status) {
    switch (status) {
        case Reply::ok:
            return "OK";
        case Reply::no_content:
            return "No Content";
        case Reply::partial_content:
            return "Partial Content";
        case Reply::moved_permanently:
            return "Moved Permanently";
        case Reply::moved_temporarily:
            return "Moved Temporarily";
        case Reply::not_modified:
            return "Not Modified";
        case Reply::bad_request:
            return "Bad Request";
        case Reply::forbidden:
            return "Forbidden";
        case Reply::not_found:
            return "Not Found";
        case Reply::method_not_allowed:
            return "Method Not Allowed";
        case Reply::length_required:
            return "Length Required";
        case Reply::payload_too_large:
            return "Payload Too Large";
        case Reply::range_not_satisfiable:
            return "Range Not Satisfiable";
        case Reply::not_implemented:
            return "Not Implemented";
        case Reply::bad_gateway:
            return "Bad Gateway";
        case Reply::service_unavailable:
            return "Service Unavailable";
        case Reply::version_not_supported:
            return "Version Not Supported";
        default:
            return "Internal Server Error";
    }
}

}  // namespace status_strings

namespace misc_strings {

const char name_value_separator[] = {':', ' '};
const char crlf[] = {'\r', '\n'};

}  // namespace misc_strings

Reply::Reply(std::vector<char> &content) : content_(content), status_(status_type::ok) {
    headers_.reserve(4);
}

void Reply::addHeader(const std::string &name, const std::string &val) {
    headers_.push_back({name, val});
}

const char *Reply::reasonPhrase(status_type status) {
    return status_strings::toReason(status);
}

void Reply::send(status_type status) {
    status_ = status;

    if (status == no_content || status == not_modified) {
        content_.clear();
    } else {
        headers_.push_back({"Content-Length", std::to_string(content_.size())});
    }

    returnToClient_ = true;
}

void Reply::send(status_type status, const std::string &contentType) {
    status_ = status;
    headers_.push_back({"Content-Length", std::to_string(content_.size())});
    headers_.push_back({"Content-Type", contentType});

    returnToClient_ = true;
}

void Reply::sendBig(status_type status,
                    const std::string &contentType,
                    size_t totalSize,
                    StreamCallback callback) {
    status_ = status;
    headers_.push_back({"Content-Length", std::to_string(totalSize)});
    headers_.push_back({"Content-Type", contentType});

    content_.clear();
    totalStreamSize_ = totalSize;
    streamedBytes_ = 0;
    streamCallback_ = totalSize > 0 ? std::move(callback) : nullptr;
    finalPart_ = !streamCallback_;

    returnToClient_ = true;
}

void Reply::sendStreaming(status_type status,
                          const std::string &contentType,
                          StreamCallback callback) {
    status_ = status;
    headers_.push_back({"Transfer-Encoding", "chunked"});
    headers_.push_back({"Content-Type", contentType});

    content_.clear();
    streamCallback_ = std::move(callback);
    useChunkedEncoding_ = true;
    finalPart_ = !streamCallback_;

    returnToClient_ = true;
}

std::string Reply::toHexString(size_t value) {
    static const char digits[] = "0123456789abcdef";
    if (value == 0) {
        return "0";
    }

    std::string hex;
    while (value > 0) {
        hex.insert(hex.begin(), digits[value & 0xf]);
        value >>= 4;
    }
    return hex;
}

void Reply::wrapContentInChunkFormat() {
    // <size in hex>\r\n<data>\r\n, an empty content becomes the last chunk.
    std::string prefix = toHexString(content_.size()) + "\r\n";
    content_.insert(content_.begin(), prefix.begin(), prefix.end());
    content_.push_back('\r');
    content_.push_back('\n');
    if (prefix == "0\r\n") {
        // last-chunk is followed by an empty trailer
        content_.push_back('\r');
        content_.push_back('\n');
    }
}

std::vector<asio::const_buffer> Reply::headerToBuffers() {
    std::vector<asio::const_buffer> buffers;

    buffers.push_back(status_strings::toBuffer(status_));
    for (std::size_t i = 0; i < headers_.size(); ++i) {
        Header &h = headers_[i];
        buffers.push_back(asio::buffer(h.name_));
        buffers.push_back(asio::buffer(misc_strings::name_value_separator));
        buffers.push_back(asio::buffer(h.value_));
        buffers.push_back(asio::buffer(misc_strings::crlf));
    }
    buffers.push_back(asio::buffer(misc_strings::crlf));
    return buffers;
}

std::vector<asio::const_buffer> Reply::contentToBuffers() {
    std::vector<asio::const_buffer> buffers;
    buffers.push_back(asio::buffer(content_));
    return buffers;
}

void Reply::stockReply(const Request &req, Reply::status_type status) {
    status_ = status;
    headers_.clear();
    streamCallback_ = nullptr;
    useChunkedEncoding_ = false;
    finalPart_ = true;
    streamFailed_ = false;

    std::string body = R"({"status":)" + std::to_string(static_cast<int>(status)) +
                       R"(,"message":")" + status_strings::toReason(status) + R"("})";
    content_.assign(body.begin(), body.end());

    if (status_ == no_content || status_ == not_modified) {
        content_.clear();
    } else {
        addHeader("Content-Length", std::to_string(content_.size()));
        addHeader("Content-Type", "application/json");
    }

    if (!isStatusOk()) {
        addHeader("Connection", "close");
    }

    if (req.method_ == "HEAD") {
        content_.clear();
    }
    returnToClient_ = true;
}

}  // namespace datasource
