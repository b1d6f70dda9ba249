#include <strings.h>

#include <algorithm>

#include "datasource/request.hpp"
#include "datasource/request_parser.hpp"

namespace datasource {

namespace {

const size_t kNoLength = std::numeric_limits<size_t>::max();

bool isCtl(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u <= 31 || u == 127;
}

// RFC 9110 tchar, what methods and header names are made of.
bool isTokenChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u <= 32 || u >= 127) {
        return false;
    }
    static const std::string separators = "()<>@,;:\\\"/[]?={}";
    return separators.find(c) == std::string::npos;
}

bool isToken(const std::string &s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), isTokenChar);
}

std::string trim(const std::string &s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

// One to three decimal digits, as in "HTTP/1.1".
bool parseVersionNumber(const std::string &text, int &out) {
    if (text.empty() || text.size() > 3) {
        return false;
    }
    out = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

bool parseVersion(const std::string &text, int &major, int &minor) {
    const std::string prefix = "HTTP/";
    if (text.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    size_t dot = text.find('.', prefix.size());
    if (dot == std::string::npos) {
        return false;
    }
    return parseVersionNumber(text.substr(prefix.size(), dot - prefix.size()), major) &&
           parseVersionNumber(text.substr(dot + 1), minor);
}

bool parseLength(const std::string &text, size_t &out) {
    // 19 digits always fit in 64 bits
    if (text.empty() || text.size() > 19) {
        return false;
    }
    out = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + static_cast<size_t>(c - '0');
    }
    return true;
}

// Case insensitive search of 'token' in a comma separated header value.
bool hasToken(const std::string &value, const char *token) {
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(',', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (strcasecmp(trim(value.substr(start, end - start)).c_str(), token) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

}  // namespace

RequestParser::RequestParser() : state_(request_line) {}

void RequestParser::reset() {
    state_ = request_line;
    line_.clear();
    bodyBytesLeft_ = 0;
    body_.clear();
}

RequestParser::result_type RequestParser::parse(Request &req,
                                                std::vector<char> &content,
                                                size_t maxContentSize) {
    maxContentSize_ = maxContentSize;
    size_t pos = 0;
    while (pos < content.size()) {
        result_type result = indeterminate;
        if (state_ == body) {
            size_t n = std::min(bodyBytesLeft_, content.size() - pos);
            body_.insert(body_.end(), content.begin() + pos, content.begin() + pos + n);
            bodyBytesLeft_ -= n;
            pos += n;
            if (bodyBytesLeft_ == 0) {
                result = good_complete;
            }
        } else {
            char c = content[pos++];
            if (c == '\n') {
                result = consumeLine(req);
                line_.clear();
            } else if (line_.size() >= kMaxLineLength) {
                return bad;
            } else {
                line_.push_back(c);
            }
        }

        if (result == good_complete) {
            // content is the receive buffer, only touch it once we are done
            // iterating over it
            req.body_.assign(body_.begin(), body_.end());
            body_.clear();
            return result;
        }
        if (result != indeterminate) {
            return result;
        }
    }
    return indeterminate;
}

RequestParser::result_type RequestParser::consumeLine(Request &req) {
    if (line_.empty() || line_.back() != '\r') {
        // bare LF
        return bad;
    }
    line_.pop_back();

    if (state_ == request_line) {
        if (line_.empty()) {
            // empty lines ahead of a request are tolerated
            return indeterminate;
        }
        return parseRequestLine(req);
    }

    if (line_.empty()) {
        result_type res = checkRequestAfterAllHeaders(req);
        if (res != indeterminate) {
            return res;
        }
        if (bodyBytesLeft_ == 0) {
            return good_complete;
        }
        state_ = body;
        return indeterminate;
    }
    return parseHeaderLine(req);
}

RequestParser::result_type RequestParser::parseRequestLine(Request &req) {
    // method SP request-target SP HTTP-version
    size_t first = line_.find(' ');
    size_t second = first == std::string::npos ? first : line_.find(' ', first + 1);
    if (second == std::string::npos || line_.find(' ', second + 1) != std::string::npos) {
        return bad;
    }

    std::string method = line_.substr(0, first);
    std::string uri = line_.substr(first + 1, second - first - 1);
    if (!isToken(method) || uri.empty() || std::any_of(uri.begin(), uri.end(), isCtl)) {
        return bad;
    }
    if (!parseVersion(line_.substr(second + 1), req.httpVersionMajor_, req.httpVersionMinor_)) {
        return bad;
    }
    req.method_ = method;
    req.uri_ = uri;

    if (req.httpVersionMajor_ > 1 || (req.httpVersionMajor_ == 1 && req.httpVersionMinor_ > 1)) {
        return version_not_supported;
    }
    // Set default keep-alive based on HTTP version. A Connection header may
    // override this later.
    req.keepAlive_ = (req.httpVersionMajor_ == 1 && req.httpVersionMinor_ > 0);
    state_ = header_lines;
    return indeterminate;
}

RequestParser::result_type RequestParser::parseHeaderLine(Request &req) {
    if (line_[0] == ' ' || line_[0] == '\t') {
        // obsolete line folding continues the previous value
        if (req.headers_.empty()) {
            return bad;
        }
        std::string more = trim(line_);
        if (std::any_of(more.begin(), more.end(), [](char c) { return isCtl(c) && c != '\t'; })) {
            return bad;
        }
        Header &h = req.headers_.back();
        h.value_ += h.value_.empty() || more.empty() ? more : " " + more;
        return indeterminate;
    }

    size_t colon = line_.find(':');
    if (colon == std::string::npos) {
        return bad;
    }
    std::string name = line_.substr(0, colon);
    std::string value = trim(line_.substr(colon + 1));
    if (!isToken(name) ||
        std::any_of(value.begin(), value.end(), [](char c) { return isCtl(c) && c != '\t'; })) {
        return bad;
    }
    if (req.headers_.size() >= kMaxHeaders) {
        return bad;
    }
    req.headers_.push_back({name, value});
    return indeterminate;
}

RequestParser::result_type RequestParser::applyHeaders(Request &req) {
    for (const Header &h : req.headers_) {
        if (strcasecmp(h.name_.c_str(), "Content-Length") == 0) {
            size_t length = 0;
            if (!parseLength(h.value_, length) ||
                (req.contentLength_ != kNoLength && req.contentLength_ != length)) {
                return bad;
            }
            req.contentLength_ = length;
        } else if (strcasecmp(h.name_.c_str(), "Transfer-Encoding") == 0) {
            // any transfer coding of a request ends in chunked
            req.isChunked_ = true;
        } else if (strcasecmp(h.name_.c_str(), "Connection") == 0) {
            if (req.httpVersionMajor_ == 1 && req.httpVersionMinor_ < 1) {
                // HTTP/1.0: Keep-Alive must be explicitly specified
                if (hasToken(h.value_, "keep-alive")) {
                    req.keepAlive_ = true;
                }
            } else if (hasToken(h.value_, "close")) {
                req.keepAlive_ = false;
            }
        }
    }
    return indeterminate;
}

RequestParser::result_type RequestParser::checkRequestAfterAllHeaders(Request &req) {
    result_type res = applyHeaders(req);
    if (res != indeterminate) {
        return res;
    }

    if (req.isChunked_) {
        // chunked request bodies are not supported
        return req.contentLength_ == kNoLength ? missing_content_length : bad;
    }

    if (req.contentLength_ == kNoLength) {
        if ((req.method_ == "POST" || req.method_ == "PUT" || req.method_ == "PATCH") &&
            req.httpVersionMajor_ == 1 && req.httpVersionMinor_ > 0) {
            return missing_content_length;
        }
        bodyBytesLeft_ = 0;
        return indeterminate;
    }

    if (req.contentLength_ > maxContentSize_) {
        return payload_too_large;
    }
    bodyBytesLeft_ = req.contentLength_;
    return indeterminate;
}

}  // namespace datasource
