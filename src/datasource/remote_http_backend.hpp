#pragma once

#include <string>
#include <vector>

#include "datasource/i_source_backend.hpp"

namespace datasource {

// Fetches paths from a remote HTTP server below a base URL. Every call is a
// network round trip, nothing is cached.
class RemoteHttpBackend : public ISourceBackend {
   public:
    struct Settings {
        Settings(long timeoutSeconds = 60,
                 long connectTimeoutSeconds = 10,
                 const std::string &userAgent = "datasource/1.0",
                 bool followRedirects = true)
            : timeoutSeconds_(timeoutSeconds),
              connectTimeoutSeconds_(connectTimeoutSeconds),
              userAgent_(userAgent),
              followRedirects_(followRedirects) {}

        // Total transfer timeout. 0 = libcurl default (none), which lets a hung
        // upstream hold a worker thread forever.
        long timeoutSeconds_;

        // Connection phase timeout. 0 = libcurl default.
        long connectTimeoutSeconds_;

        std::string userAgent_;

        bool followRedirects_;

        // Extra request headers, "Name: value".
        std::vector<std::string> headers_;
    };

    RemoteHttpBackend(const std::string &baseUrl, Settings settings = Settings());
    virtual ~RemoteHttpBackend() = default;

    SourceKind kind() const override;

    // HEAD request, falls back to a GET when the upstream does not allow HEAD.
    bool exists(const LogicalPath &path) const override;

    FetchResult fetch(const LogicalPath &path) const override;
    std::string describe() const override;

    // Base URL joined with the URL-escaped segments of 'path'.
    std::string urlFor(const LogicalPath &path) const;

   private:
    struct Transfer {
        long httpCode_ = 0;
        std::vector<char> body_;
        std::string err_;
    };

    // Perform one request. Returns false on transport failure.
    bool perform(const std::string &url, bool headOnly, Transfer &transfer) const;

    const std::string baseUrl_;
    const Settings settings_;
};

}  // namespace datasource
