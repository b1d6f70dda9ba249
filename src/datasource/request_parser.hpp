#pragma once

#include <limits>
#include <string>
#include <vector>

namespace datasource {

struct Request;

// Incremental parser for HTTP/1.x requests. The head is taken line by line,
// a body is only accepted when it fits in the receive buffer. File serving
// never needs more.
class RequestParser {
   public:
    RequestParser();
    ~RequestParser() = default;

    // Reset to initial parser state.
    void reset();

    // Result of parse.
    enum result_type {
        good_complete,
        bad,
        version_not_supported,
        missing_content_length,
        payload_too_large,
        indeterminate
    };

    // Parse some data. good_complete when a complete request has been parsed,
    // indeterminate when more data is required, otherwise the kind of error.
    result_type parse(Request &req, std::vector<char> &content, size_t maxContentSize);

   private:
    // Longest request or header line accepted, CRLF included.
    static const size_t kMaxLineLength = 8192;

    // Most header lines accepted in one request.
    static const size_t kMaxHeaders = 100;

    // Handle one complete line of the head, without its CRLF.
    result_type consumeLine(Request &req);
    result_type parseRequestLine(Request &req);
    result_type parseHeaderLine(Request &req);

    // Act on the headers the parser itself needs, once the head is complete.
    result_type applyHeaders(Request &req);

    result_type checkRequestAfterAllHeaders(Request &req);

    enum state { request_line, header_lines, body } state_;

    // The head line being collected.
    std::string line_;

    // Body bytes still expected.
    std::size_t bodyBytesLeft_ = 0;

    // Body collected so far, may span several reads.
    std::vector<char> body_;

    size_t maxContentSize_ = std::numeric_limits<size_t>::max();
};

}  // namespace datasource
