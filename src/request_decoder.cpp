#include <cctype>
#include <cstdlib>

#include "datasource/request_decoder.hpp"

namespace datasource {

bool RequestDecoder::decodeRequest(Request &req) {
    req.requestPath_ = urlDecode(req.uri_.substr(0, req.uri_.find('?')));

    // request path must be absolute, traversal is checked when resolving
    if (req.requestPath_.empty() || req.requestPath_[0] != '/') {
        return false;
    }
    return true;
}

std::string RequestDecoder::urlDecode(const std::string &in) {
    std::string decoded;
    decoded.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%' && i + 2 < in.size() &&
            std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            char hs[]{in[i + 1], in[i + 2], '\0'};
            decoded += static_cast<char>(std::strtol(hs, nullptr, 16));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

}  // namespace datasource
