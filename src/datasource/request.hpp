#pragma once

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>
#include <vector>

#include "datasource/header.hpp"

namespace datasource {

// A request received from a client.
struct Request {
    friend class Connection;
    friend class RequestParser;
    friend class RequestDecoder;

    Request(std::vector<char> &body) : body_(body) {}

    std::string method_;
    std::string uri_;
    int httpVersionMajor_ = 0;
    int httpVersionMinor_ = 0;
    std::vector<Header> headers_;
    bool keepAlive_ = true;

    // Decoded path without query string.
    std::string requestPath_;
    std::vector<char> &body_;

    // convenience functions
    // case insensitive
    std::string getHeaderValue(const std::string &name) const {
        auto it = std::find_if(headers_.begin(), headers_.end(), [&](const Header &h) {
            return iequals(h.name_, name);
        });
        if (it != headers_.end()) {
            return it->value_;
        }
        return "";
    }

    // check if requestPath_ starts with specified string
    bool startsWith(const std::string &sw) const {
        return requestPath_.rfind(sw, 0) == 0;
    }

   private:
    void reset() {
        method_.clear();
        uri_.clear();
        headers_.clear();
        requestPath_.clear();
        body_.clear();
        keepAlive_ = true;
        isChunked_ = false;
        contentLength_ = std::numeric_limits<size_t>::max();
    }

    static bool ichar_equals(char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    }

    static bool iequals(const std::string &a, const std::string &b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), ichar_equals);
    }

    bool isChunked_ = false;
    size_t contentLength_ = std::numeric_limits<size_t>::max();
};

}  // namespace datasource
