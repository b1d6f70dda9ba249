#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <string>
#include <vector>

#include "datasource/reply.hpp"
#include "datasource/request.hpp"
#include "datasource/request_handler.hpp"

using namespace datasource;

namespace {

// Stream callback over a string, optionally failing after 'failAfter' bytes.
struct StringSource {
    StringSource(const std::string &data, size_t failAfter = std::string::npos)
        : data_(data), failAfter_(failAfter) {}

    StreamCallback callback() {
        return [this](const std::string &, char *buf, size_t maxSize) -> int {
            noCalls_++;
            size_t end = std::min(data_.size(), failAfter_);
            if (pos_ >= end) {
                return failAfter_ == std::string::npos ? 0 : -1;
            }
            size_t n = std::min(maxSize, end - pos_);
            data_.copy(buf, n, pos_);
            pos_ += n;
            return static_cast<int>(n);
        };
    }

    std::string data_;
    size_t failAfter_;
    size_t pos_ = 0;
    int noCalls_ = 0;
};

struct HandlerFixture {
    HandlerFixture() : request_(requestBody_), reply_(replyContent_), handler_(1024) {
        request_.method_ = "GET";
        request_.requestPath_ = "/file";
    }

    std::string content() const {
        return std::string(replyContent_.begin(), replyContent_.end());
    }

    std::vector<char> requestBody_;
    std::vector<char> replyContent_;
    Request request_;
    Reply reply_;
    RequestHandler handler_;
};

}  // namespace

TEST_CASE("request handler dispatch", "[request_handler]") {
    HandlerFixture f;

    SECTION("should answer 404 without handlers") {
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getStatus() == Reply::not_found);
        REQUIRE(f.content() == R"({"status":404,"message":"Not Found"})");
        REQUIRE(f.reply_.getHeaderValue("Connection") == "close");
    }
    SECTION("should stop at the first handler that replies") {
        int secondCalls = 0;
        f.handler_.addRequestHandler([](const Request &, Reply &) {});
        f.handler_.addRequestHandler([](const Request &, Reply &rep) {
            rep.content_.assign({'o', 'k'});
            rep.send(Reply::ok, "text/plain");
        });
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            secondCalls++;
            rep.send(Reply::ok);
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getStatus() == Reply::ok);
        REQUIRE(f.content() == "ok");
        REQUIRE(secondCalls == 0);
    }
    SECTION("should drop the body for HEAD") {
        f.request_.method_ = "HEAD";
        f.handler_.addRequestHandler([](const Request &, Reply &rep) {
            rep.content_.assign({'o', 'k'});
            rep.send(Reply::ok, "text/plain");
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.content().empty());
        REQUIRE(f.reply_.getHeaderValue("Content-Length") == "2");
    }
}

TEST_CASE("request handler streaming", "[request_handler]") {
    HandlerFixture f;

    SECTION("should fill the first part of a sized stream") {
        StringSource source(std::string(3000, 'z'));
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendBig(Reply::ok, "application/octet-stream", 3000, source.callback());
        });
        f.handler_.handleRequest(7, f.request_, f.reply_);
        REQUIRE(f.replyContent_.size() == 1024);

        f.handler_.handleStreamingRead(7, f.reply_);
        REQUIRE(f.replyContent_.size() == 1024);
        f.handler_.handleStreamingRead(7, f.reply_);
        REQUIRE(f.replyContent_.size() == 952);

        // complete, no more reads
        f.handler_.handleStreamingRead(7, f.reply_);
        REQUIRE(f.replyContent_.empty());
        REQUIRE(source.noCalls_ == 3);
    }
    SECTION("should never ask for more than announced") {
        StringSource source("0123456789");
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendBig(Reply::ok, "text/plain", 4, source.callback());
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.content() == "0123");
    }
    SECTION("should wrap unsized streams in chunks") {
        StringSource source("hello");
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendStreaming(Reply::ok, "text/plain", source.callback());
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getHeaderValue("Transfer-Encoding") == "chunked");
        REQUIRE(f.content() == "5\r\nhello\r\n");

        f.handler_.handleStreamingRead(0, f.reply_);
        REQUIRE(f.content() == "0\r\n\r\n");

        f.handler_.handleStreamingRead(0, f.reply_);
        REQUIRE(f.content().empty());
    }
    SECTION("should fall back to 500 when the first read fails") {
        StringSource source("abc", 0);
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendBig(Reply::ok, "text/plain", 3, source.callback());
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getStatus() == Reply::internal_server_error);
        REQUIRE(!f.reply_.hasStream());
        REQUIRE(f.content() == R"({"status":500,"message":"Internal Server Error"})");
    }
    SECTION("should stop after a failure midway") {
        StringSource source(std::string(2000, 'q'), 1500);
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendBig(Reply::ok, "text/plain", 2000, source.callback());
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getStatus() == Reply::ok);
        REQUIRE(f.replyContent_.size() == 1024);

        f.handler_.handleStreamingRead(0, f.reply_);
        REQUIRE(f.replyContent_.size() == 476);
        f.handler_.handleStreamingRead(0, f.reply_);
        REQUIRE(f.replyContent_.empty());

        // nothing is read after the failure
        int calls = source.noCalls_;
        f.handler_.handleStreamingRead(0, f.reply_);
        REQUIRE(source.noCalls_ == calls);
    }
    SECTION("HEAD should not touch the stream") {
        f.request_.method_ = "HEAD";
        StringSource source("hello");
        f.handler_.addRequestHandler([&](const Request &, Reply &rep) {
            rep.sendBig(Reply::ok, "text/plain", 5, source.callback());
        });
        f.handler_.handleRequest(0, f.request_, f.reply_);
        REQUIRE(f.reply_.getHeaderValue("Content-Length") == "5");
        REQUIRE(!f.reply_.hasStream());
        REQUIRE(source.noCalls_ == 0);
    }
}
