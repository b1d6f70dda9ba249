#pragma once

#include <string>

#include "datasource/request.hpp"

namespace datasource {

// Turns the request URI into a decoded absolute path. The query string is
// dropped, file serving has no use for it.
class RequestDecoder {
   public:
    RequestDecoder() = default;
    virtual ~RequestDecoder() = default;

    // Returns false if the URI is not an absolute path.
    bool decodeRequest(Request &req);

    // Percent-decoding of a path. '+' stays as is.
    static std::string urlDecode(const std::string &in);
};

}  // namespace datasource
