#pragma once

#include <memory>
#include <string>
#include <vector>

#include "datasource/data_source.hpp"
#include "datasource/datasource_common.hpp"
#include "datasource/header.hpp"
#include "datasource/logical_path.hpp"
#include "datasource/reply.hpp"
#include "datasource/request.hpp"
#include "datasource/router.hpp"

namespace datasource {

// What the file server answers for one request, independent of any socket.
struct FileResponse {
    Reply::status_type status_ = Reply::ok;
    std::string contentType_;

    // Extra headers, e.g. Accept-Ranges, Content-Range, Allow.
    std::vector<Header> headers_;

    // Small in-memory body, used for error replies.
    std::string body_;

    // Body of a successful GET. Yields exactly contentLength_ bytes when
    // that is known.
    std::unique_ptr<IByteStream> stream_;

    // Length of the body a GET would carry, IByteStream::unknownSize if the
    // backend did not report one.
    size_t contentLength_ = IByteStream::unknownSize;

    // Set for HEAD. stream_ and body_ are not sent but contentLength_ and
    // the headers are those of the corresponding GET.
    bool headOnly_ = false;

    std::string getHeaderValue(const std::string &name) const;
};

// Serves files of one DataSource over HTTP.
class FileServer {
   public:
    struct Settings {
        Settings(const std::string &indexFile = kDefaultIndexFile, size_t maxFileSize = 0)
            : indexFile_(indexFile), maxFileSize_(maxFileSize) {}

        // Document served for empty and directory paths.
        std::string indexFile_;

        // Larger files are refused with 413. 0 = no limit.
        size_t maxFileSize_;

        // Added to every successful reply, e.g. Cache-Control.
        std::vector<Header> headers_;
    };

    FileServer(const FileServer &) = delete;
    FileServer &operator=(const FileServer &) = delete;

    explicit FileServer(std::shared_ptr<const DataSource> source, Settings settings = Settings());
    ~FileServer() = default;

    // Map a request to a response. 'capturedPath' is the raw remainder of the
    // URL path below the mount point, 'rangeHeader' the value of the Range
    // header (empty if absent).
    FileResponse respond(const std::string &method,
                         const std::string &capturedPath,
                         const std::string &rangeHeader = "") const;

    // Write respond()'s result into 'rep'. Bodies are streamed in parts of
    // the server's buffer size.
    void handleRequest(const Request &req, Reply &rep, const std::string &capturedPath) const;

    const DataSource &source() const {
        return *source_;
    }

    const Settings &settings() const {
        return settings_;
    }

    void setDebugMsgHandler(const debugMsgCallback &cb);

   private:
    FileResponse errorResponse(Reply::status_type status,
                               const std::string &capturedPath,
                               const std::string &error) const;

    std::shared_ptr<const DataSource> source_;
    const Settings settings_;
    const PathResolver resolver_;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;
};

// Outcome of parsing a Range header against a known length.
enum class RangeResult { Ignored, Satisfiable, Unsatisfiable };

// Single byte range "bytes=a-b", "bytes=a-" or "bytes=-n". On Satisfiable
// 'first' and 'last' are the inclusive byte positions. Malformed and
// multi-range headers are Ignored.
RangeResult parseRange(const std::string &header, size_t length, size_t &first, size_t &last);

// Status code for a failed fetch.
Reply::status_type toStatus(FetchError error);

// Bind 'fileServer' to GET (and HEAD) on 'pattern', which must end with a
// catch-all segment such as "/static/{path*}". Returns false otherwise.
bool registerFileServerRoute(Router &router,
                             const std::string &pattern,
                             std::shared_ptr<const FileServer> fileServer);

}  // namespace datasource
