#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "datasource/data_source.hpp"
#include "datasource/file_server.hpp"
#include "datasource/remote_http_backend.hpp"
#include "utils/server_fixture.hpp"

using namespace datasource;

namespace {

LogicalPath path(const std::string &raw) {
    LogicalPath p;
    REQUIRE(resolvePath(raw, p) == FetchError::None);
    return p;
}

std::shared_ptr<const FileServer> memoryFileServer() {
    std::unique_ptr<DataSource> source;
    std::string err;
    REQUIRE(DataSource::fromMemoryMap({{"a/b.txt", toBytes("hello")},
                                       {"index.html", toBytes("<h1>remote</h1>")},
                                       {"with space.txt", toBytes("spaced")}},
                                      source,
                                      err));
    return std::make_shared<FileServer>(std::shared_ptr<const DataSource>(std::move(source)));
}

}  // namespace

TEST_CASE("remote http backend", "[remote_http]") {
    ServerFixture upstream;
    REQUIRE(upstream.mount("/site/{path*}", memoryFileServer()));
    REQUIRE(upstream.router().addRoute(
        "GET",
        "/broken/{path*}",
        [](const Request &, Reply &rep, const std::unordered_map<std::string, std::string> &) {
            rep.send(Reply::service_unavailable);
        }));
    upstream.start();

    RemoteHttpBackend::Settings settings(10, 5);
    RemoteHttpBackend backend(upstream.baseUrl() + "/site/", settings);
    REQUIRE(backend.kind() == SourceKind::RemoteHttp);

    SECTION("should fetch below the base URL") {
        FetchResult result = backend.fetch(path("a/b.txt"));
        REQUIRE(result.ok());
        REQUIRE(result.origin_ == upstream.baseUrl() + "/site/a/b.txt");
        std::vector<char> out;
        std::string err;
        REQUIRE(readAll(*result.stream_, out, err));
        REQUIRE(std::string(out.begin(), out.end()) == "hello");
    }
    SECTION("should escape segments") {
        REQUIRE(backend.urlFor(path("with space.txt")) ==
                upstream.baseUrl() + "/site/with%20space.txt");
        FetchResult result = backend.fetch(path("with space.txt"));
        REQUIRE(result.ok());
        REQUIRE(result.stream_->size() == 6);
    }
    SECTION("should map 404 to NotFound") {
        FetchResult result = backend.fetch(path("missing.txt"));
        REQUIRE(result.error_ == FetchError::NotFound);
        REQUIRE(result.stream_ == nullptr);
    }
    SECTION("should map other failures to UpstreamError") {
        RemoteHttpBackend broken(upstream.baseUrl() + "/broken", settings);
        FetchResult result = broken.fetch(path("x.txt"));
        REQUIRE(result.error_ == FetchError::UpstreamError);
        REQUIRE(result.message_ ==
                "Upstream answered 503 for " + upstream.baseUrl() + "/broken/x.txt");
    }
    SECTION("should check existence with HEAD") {
        REQUIRE(backend.exists(path("a/b.txt")));
        REQUIRE(backend.exists(path("/")));
        REQUIRE(!backend.exists(path("missing.txt")));
    }
    SECTION("should work through a DataSource") {
        DataSource source = DataSource::fromRemoteHttp(upstream.baseUrl() + "/site", settings);
        std::string out;
        std::string err;
        REQUIRE(source.readToString("/", out, err) == FetchError::None);
        REQUIRE(out == "<h1>remote</h1>");
        REQUIRE(source.readToString("..", out, err) == FetchError::InvalidPath);
    }
}

TEST_CASE("remote http backend transport failure", "[remote_http]") {
    // nothing listens on port 1
    RemoteHttpBackend backend("http://127.0.0.1:1/", RemoteHttpBackend::Settings(5, 2));

    FetchResult result = backend.fetch(path("a.txt"));
    REQUIRE(result.error_ == FetchError::IoError);
    REQUIRE(result.message_.find("HTTP request failed") == 0);
    REQUIRE(!backend.exists(path("a.txt")));
    REQUIRE(backend.describe() == "remote[http://127.0.0.1:1/]");
}

TEST_CASE("remote url building", "[remote_http]") {
    RemoteHttpBackend backend("http://example.com/base///");
    REQUIRE(backend.urlFor(path("a/b c/d.txt")) == "http://example.com/base/a/b%20c/d.txt");
    REQUIRE(backend.urlFor(path("/")) == "http://example.com/base/index.html");
}
