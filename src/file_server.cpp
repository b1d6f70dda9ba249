#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <memory>
#include <unordered_map>

#include "cJSON.h"
#include "datasource/file_server.hpp"
#include "datasource/mime_types.hpp"

namespace datasource {

namespace {

// Restricts an already positioned stream to the next 'length' bytes.
class RangeStream : public IByteStream {
   public:
    RangeStream(std::unique_ptr<IByteStream> inner, size_t length)
        : inner_(std::move(inner)), length_(length), left_(length) {}

    int read(char *buf, size_t maxSize) override {
        if (left_ == 0) {
            return 0;
        }
        int bytesRead = inner_->read(buf, std::min(maxSize, left_));
        if (bytesRead > 0) {
            left_ -= bytesRead;
        }
        return bytesRead;
    }

    size_t size() const override {
        return length_;
    }

    size_t skip(size_t n) override {
        size_t skipped = inner_->skip(std::min(n, left_));
        left_ -= skipped;
        return skipped;
    }

    std::string errorMessage() const override {
        return inner_->errorMessage();
    }

   private:
    std::unique_ptr<IByteStream> inner_;
    const size_t length_;
    size_t left_;
};

std::string trim(const std::string &s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool parseNumber(const std::string &s, size_t &value) {
    if (s.empty()) {
        return false;
    }

    value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    return true;
}

bool isSuccess(Reply::status_type status) {
    return status == Reply::ok || status == Reply::partial_content;
}

}  // namespace

std::string FileResponse::getHeaderValue(const std::string &name) const {
    auto it = std::find_if(headers_.begin(), headers_.end(), [&](const Header &h) {
        return h.name_.size() == name.size() &&
               std::equal(h.name_.begin(), h.name_.end(), name.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
    return it != headers_.end() ? it->value_ : "";
}

Reply::status_type toStatus(FetchError error) {
    switch (error) {
        case FetchError::None:
            return Reply::ok;
        case FetchError::InvalidPath:
            return Reply::bad_request;
        case FetchError::NotFound:
            return Reply::not_found;
        case FetchError::UpstreamError:
            return Reply::bad_gateway;
        case FetchError::IoError:
        case FetchError::DecodeError:
        default:
            return Reply::internal_server_error;
    }
}

RangeResult parseRange(const std::string &header, size_t length, size_t &first, size_t &last) {
    const std::string unit = "bytes=";
    if (header.compare(0, unit.size(), unit) != 0) {
        return RangeResult::Ignored;
    }

    std::string rangeSet = trim(header.substr(unit.size()));
    if (rangeSet.find(',') != std::string::npos) {
        // multipart/byteranges replies are not supported
        return RangeResult::Ignored;
    }

    size_t dash = rangeSet.find('-');
    if (dash == std::string::npos) {
        return RangeResult::Ignored;
    }

    std::string from = trim(rangeSet.substr(0, dash));
    std::string to = trim(rangeSet.substr(dash + 1));

    size_t fromValue = 0;
    size_t toValue = 0;
    if (from.empty()) {
        // suffix range, the last 'toValue' bytes
        if (!parseNumber(to, toValue)) {
            return RangeResult::Ignored;
        }
        if (toValue == 0 || length == 0) {
            return RangeResult::Unsatisfiable;
        }
        first = toValue >= length ? 0 : length - toValue;
        last = length - 1;
        return RangeResult::Satisfiable;
    }

    if (!parseNumber(from, fromValue)) {
        return RangeResult::Ignored;
    }
    if (!to.empty() && (!parseNumber(to, toValue) || toValue < fromValue)) {
        return RangeResult::Ignored;
    }
    if (fromValue >= length) {
        return RangeResult::Unsatisfiable;
    }

    first = fromValue;
    last = to.empty() ? length - 1 : std::min(toValue, length - 1);
    return RangeResult::Satisfiable;
}

FileServer::FileServer(std::shared_ptr<const DataSource> source, Settings settings)
    : source_(std::move(source)),
      settings_(std::move(settings)),
      resolver_(settings_.indexFile_),
      debugMsgCb_([](const std::string &) {}) {}

void FileServer::setDebugMsgHandler(const debugMsgCallback &cb) {
    debugMsgCb_ = cb;
}

FileResponse FileServer::errorResponse(Reply::status_type status,
                                       const std::string &capturedPath,
                                       const std::string &error) const {
    FileResponse res;
    res.status_ = status;
    res.contentType_ = "application/json";
    res.contentLength_ = 0;

    cJSON *root = cJSON_CreateObject();
    if (root != nullptr) {
        cJSON_AddNumberToObject(root, "status", static_cast<double>(status));
        cJSON_AddStringToObject(root, "message", Reply::reasonPhrase(status));
        cJSON_AddStringToObject(root, "path", capturedPath.c_str());
        cJSON_AddStringToObject(root, "error", error.c_str());

        char *json = cJSON_PrintUnformatted(root);
        if (json != nullptr) {
            res.body_ = json;
            free(json);
        }
        cJSON_Delete(root);
    }

    if (res.body_.empty()) {
        // cJSON out of memory, fall back to the reason phrase
        res.contentType_ = "text/plain";
        res.body_ = Reply::reasonPhrase(status);
    }
    res.contentLength_ = res.body_.size();

    debugMsgCb_("FileServer: " + std::to_string(static_cast<int>(status)) + " '" + capturedPath +
                "': " + error);
    return res;
}

FileResponse FileServer::respond(const std::string &method,
                                 const std::string &capturedPath,
                                 const std::string &rangeHeader) const {
    if (method != "GET" && method != "HEAD") {
        FileResponse res = errorResponse(
            Reply::method_not_allowed, capturedPath, "Method " + method + " is not allowed");
        res.headers_.push_back({"Allow", "GET, HEAD"});
        return res;
    }
    const bool headOnly = method == "HEAD";

    LogicalPath path;
    if (resolver_.resolve(capturedPath, path) != FetchError::None) {
        FileResponse res = errorResponse(Reply::bad_request, capturedPath, "InvalidPath");
        res.headOnly_ = headOnly;
        return res;
    }

    FetchResult result = source_->fetch(path);
    if (!result.ok()) {
        FileResponse res = errorResponse(toStatus(result.error_),
                                         capturedPath,
                                         std::string(toString(result.error_)) + ": " +
                                             result.message_);
        res.headOnly_ = headOnly;
        return res;
    }

    const size_t length = result.stream_->size();
    const bool knownLength = length != IByteStream::unknownSize;
    if (settings_.maxFileSize_ > 0 && knownLength && length > settings_.maxFileSize_) {
        FileResponse res = errorResponse(Reply::payload_too_large,
                                         capturedPath,
                                         "File size " + std::to_string(length) +
                                             " exceeds limit " +
                                             std::to_string(settings_.maxFileSize_));
        res.headOnly_ = headOnly;
        return res;
    }

    FileResponse res;
    res.headOnly_ = headOnly;
    res.contentType_ = mime_types::extensionToType(path.extension());
    res.headers_ = settings_.headers_;
    res.contentLength_ = length;
    res.stream_ = std::move(result.stream_);

    if (knownLength) {
        res.headers_.push_back({"Accept-Ranges", "bytes"});

        size_t first = 0;
        size_t last = 0;
        RangeResult range =
            rangeHeader.empty() ? RangeResult::Ignored : parseRange(rangeHeader, length, first, last);

        if (range == RangeResult::Unsatisfiable) {
            FileResponse err = errorResponse(Reply::range_not_satisfiable,
                                             capturedPath,
                                             "Range not satisfiable: " + rangeHeader);
            err.headers_.push_back({"Content-Range", "bytes */" + std::to_string(length)});
            err.headOnly_ = headOnly;
            return err;
        }

        if (range == RangeResult::Satisfiable) {
            if (!headOnly && res.stream_->skip(first) != first) {
                FileResponse err = errorResponse(
                    Reply::internal_server_error,
                    capturedPath,
                    "IoError: cannot position at byte " + std::to_string(first) + ". " +
                        res.stream_->errorMessage());
                err.headOnly_ = headOnly;
                return err;
            }
            res.status_ = Reply::partial_content;
            res.contentLength_ = last - first + 1;
            res.headers_.push_back({"Content-Range",
                                    "bytes " + std::to_string(first) + "-" +
                                        std::to_string(last) + "/" + std::to_string(length)});
            res.stream_ = std::make_unique<RangeStream>(std::move(res.stream_), res.contentLength_);
        }
    }

    if (headOnly) {
        res.stream_.reset();
    }

    debugMsgCb_("FileServer: " + std::to_string(static_cast<int>(res.status_)) + " '" +
                capturedPath + "' from " + result.origin_);
    return res;
}

void FileServer::handleRequest(const Request &req,
                               Reply &rep,
                               const std::string &capturedPath) const {
    FileResponse res = respond(req.method_, capturedPath, req.getHeaderValue("Range"));

    for (const auto &header : res.headers_) {
        rep.addHeader(header.name_, header.value_);
    }

    if (!isSuccess(res.status_)) {
        // RequestHandler drops the body again for HEAD
        rep.content_.assign(res.body_.begin(), res.body_.end());
        rep.send(res.status_, res.contentType_);
        return;
    }

    StreamCallback callback = nullptr;
    if (res.stream_) {
        std::shared_ptr<IByteStream> stream(std::move(res.stream_));
        debugMsgCallback debugMsg = debugMsgCb_;
        callback = [stream, debugMsg, capturedPath](
                       const std::string &id, char *buf, size_t maxSize) {
            int bytesRead = stream->read(buf, maxSize);
            if (bytesRead < 0) {
                debugMsg("FileServer: read of '" + capturedPath + "' failed on connection " + id +
                         ": " + stream->errorMessage());
            }
            return bytesRead;
        };
    }

    if (res.contentLength_ != IByteStream::unknownSize) {
        rep.sendBig(res.status_, res.contentType_, res.contentLength_, callback);
    } else {
        rep.sendStreaming(res.status_, res.contentType_, callback);
    }
}

bool registerFileServerRoute(Router &router,
                             const std::string &pattern,
                             std::shared_ptr<const FileServer> fileServer) {
    if (!fileServer) {
        return false;
    }

    size_t slash = pattern.find_last_of('/');
    std::string last = slash == std::string::npos ? pattern : pattern.substr(slash + 1);
    if (last.size() < 4 || last.front() != '{' || last.compare(last.size() - 2, 2, "*}") != 0) {
        return false;
    }
    const std::string name = last.substr(1, last.size() - 3);

    return router.addRoute(
        "GET",
        pattern,
        [fileServer, name](const Request &req,
                           Reply &rep,
                           const std::unordered_map<std::string, std::string> &params) {
            auto it = params.find(name);
            fileServer->handleRequest(req, rep, it != params.end() ? it->second : "");
        });
}

}  // namespace datasource
