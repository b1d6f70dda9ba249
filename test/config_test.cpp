#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include "datasource/config.hpp"
#include "utils/tar_builder.hpp"
#include "utils/temp_dir.hpp"

using namespace datasource;

namespace {

const std::string FullConfig = R"({
    "address": "127.0.0.1",
    "port": 9000,
    "maxContentSize": 4096,
    "keepAliveTimeout": 10,
    "keepAliveMax": 50,
    "connectionLimit": 20,
    "workerThreads": 8,
    "verbose": true,
    "mounts": [
        {
            "route": "/static/{path*}",
            "index": "default.htm",
            "maxFileSize": 1048576,
            "headers": { "Cache-Control": "max-age=3600" },
            "source": { "type": "folders", "paths": ["./www", "/srv/www"], "includeCurrentDir": true }
        },
        {
            "route": "/bundle/{path*}",
            "source": { "type": "archive", "path": "site.tar.gz", "compressed": true, "index": false }
        },
        {
            "route": "/mem/{path*}",
            "source": { "type": "memory", "entries": { "a/b.txt": "hello" } }
        },
        {
            "route": "/cdn/{path*}",
            "source": {
                "type": "remote",
                "baseUrl": "http://example.com/assets",
                "timeout": 30,
                "connectTimeout": 5,
                "userAgent": "tester",
                "headers": { "Authorization": "Bearer abc" }
            }
        }
    ]
})";

std::string withMount(const std::string &mount) {
    return R"({ "mounts": [ )" + mount + " ] }";
}

}  // namespace

TEST_CASE("load config", "[config]") {
    ServerConfig config;
    std::string err;

    SECTION("should read all settings") {
        REQUIRE(loadConfig(FullConfig, config, err));
        REQUIRE(config.address_ == "127.0.0.1");
        REQUIRE(config.port_ == "9000");
        REQUIRE(config.maxContentSize_ == 4096);
        REQUIRE(config.keepAliveTimeout_ == 10);
        REQUIRE(config.keepAliveMax_ == 50);
        REQUIRE(config.connectionLimit_ == 20);
        REQUIRE(config.workerThreads_ == 8);
        REQUIRE(config.verbose_);
        REQUIRE(config.mounts_.size() == 4);

        const MountConfig &folders = config.mounts_[0];
        REQUIRE(folders.route_ == "/static/{path*}");
        REQUIRE(folders.index_ == "default.htm");
        REQUIRE(folders.maxFileSize_ == 1048576);
        REQUIRE(folders.headers_.size() == 1);
        REQUIRE(folders.headers_[0].name_ == "Cache-Control");
        REQUIRE(folders.headers_[0].value_ == "max-age=3600");
        REQUIRE(folders.source_.kind_ == SourceKind::FileSystem);
        REQUIRE(folders.source_.paths_ == std::vector<std::string>{"./www", "/srv/www"});
        REQUIRE(folders.source_.includeCurrentDir_);

        const SourceConfig &archive = config.mounts_[1].source_;
        REQUIRE(archive.kind_ == SourceKind::Archive);
        REQUIRE(archive.archivePath_ == "site.tar.gz");
        REQUIRE(archive.compressed_);
        REQUIRE(!archive.buildIndex_);
        REQUIRE(config.mounts_[1].index_ == "index.html");

        const SourceConfig &memory = config.mounts_[2].source_;
        REQUIRE(memory.kind_ == SourceKind::MemoryMap);
        REQUIRE(memory.entries_.at("a/b.txt") == "hello");

        const SourceConfig &remote = config.mounts_[3].source_;
        REQUIRE(remote.kind_ == SourceKind::RemoteHttp);
        REQUIRE(remote.baseUrl_ == "http://example.com/assets");
        REQUIRE(remote.remote_.timeoutSeconds_ == 30);
        REQUIRE(remote.remote_.connectTimeoutSeconds_ == 5);
        REQUIRE(remote.remote_.userAgent_ == "tester");
        REQUIRE(remote.remote_.headers_ == std::vector<std::string>{"Authorization: Bearer abc"});
    }
    SECTION("should use defaults") {
        REQUIRE(loadConfig(
            withMount(R"({ "route": "/{path*}", "source": { "type": "folders", "paths": ["."] } })"),
            config,
            err));
        REQUIRE(config.address_ == "0.0.0.0");
        REQUIRE(config.port_ == "8080");
        REQUIRE(config.maxContentSize_ == 8192);
        REQUIRE(config.keepAliveTimeout_ == 5);
        REQUIRE(config.keepAliveMax_ == 100);
        REQUIRE(config.connectionLimit_ == 0);
        REQUIRE(config.workerThreads_ == 4);
        REQUIRE(!config.verbose_);
        REQUIRE(config.mounts_[0].maxFileSize_ == 0);
        REQUIRE(SourceConfig().remote_.timeoutSeconds_ == 60);
        REQUIRE(SourceConfig().remote_.connectTimeoutSeconds_ == 10);
    }
    SECTION("should accept the port as a string") {
        REQUIRE(loadConfig(
            R"({ "port": "0", "mounts": [ { "route": "/{p*}", "source": { "type": "memory", "entries": {} } } ] })",
            config,
            err));
        REQUIRE(config.port_ == "0");
    }
}

TEST_CASE("load config errors", "[config]") {
    ServerConfig config;
    std::string err;

    SECTION("invalid JSON") {
        REQUIRE_FALSE(loadConfig("{ not json", config, err));
        REQUIRE(err.find("invalid JSON") == 0);
    }
    SECTION("not an object") {
        REQUIRE_FALSE(loadConfig("[]", config, err));
    }
    SECTION("missing mounts") {
        REQUIRE_FALSE(loadConfig(R"({ "port": 80 })", config, err));
        REQUIRE(err == "'mounts' must be a non-empty array");
        REQUIRE_FALSE(loadConfig(R"({ "mounts": [] })", config, err));
    }
    SECTION("port out of range") {
        REQUIRE_FALSE(loadConfig(R"({ "port": 70000, "mounts": [] })", config, err));
        REQUIRE(err == "'port' must be in 0..65535");
        REQUIRE_FALSE(loadConfig(R"({ "port": -1, "mounts": [] })", config, err));
        REQUIRE_FALSE(loadConfig(R"({ "port": 1.5, "mounts": [] })", config, err));
    }
    SECTION("counts too large for their type") {
        REQUIRE_FALSE(loadConfig(R"({ "keepAliveMax": 1e20, "mounts": [] })", config, err));
        REQUIRE(err == "'keepAliveMax' must be a non-negative integer");
        REQUIRE_FALSE(
            loadConfig(R"({ "maxContentSize": 18446744073709551616, "mounts": [] })", config, err));
        REQUIRE(err == "'maxContentSize' must be a non-negative integer");
        REQUIRE_FALSE(loadConfig(
            withMount(
                R"({ "route": "/{p*}", "source": { "type": "remote", "baseUrl": "http://a", "timeout": 9223372036854775808 } })"),
            config,
            err));
        REQUIRE(err.find("'timeout' must be a non-negative integer") != std::string::npos);
    }
    SECTION("worker threads out of range") {
        REQUIRE_FALSE(loadConfig(R"({ "workerThreads": 0, "mounts": [] })", config, err));
        REQUIRE(err == "'workerThreads' must be in 1..256");
        REQUIRE_FALSE(loadConfig(R"({ "workerThreads": 300, "mounts": [] })", config, err));
        REQUIRE(err == "'workerThreads' must be in 1..256");
    }
    SECTION("small receive buffer") {
        REQUIRE_FALSE(loadConfig(R"({ "maxContentSize": 100, "mounts": [] })", config, err));
        REQUIRE(err == "'maxContentSize' must be at least 1024");
    }
    SECTION("wrong types") {
        REQUIRE_FALSE(loadConfig(R"({ "verbose": "yes", "mounts": [] })", config, err));
        REQUIRE(err == "'verbose' must be true or false");
        REQUIRE_FALSE(loadConfig(R"({ "address": 1, "mounts": [] })", config, err));
        REQUIRE(err == "'address' must be a string");
    }
    SECTION("mount without route or source") {
        REQUIRE_FALSE(loadConfig(withMount(R"({ "source": { "type": "memory", "entries": {} } })"),
                                 config,
                                 err));
        REQUIRE(err == "mount needs a 'route'");
        REQUIRE_FALSE(loadConfig(withMount(R"({ "route": "/{p*}" })"), config, err));
        REQUIRE(err == "mount '/{p*}' needs a 'source'");
    }
    SECTION("index with a directory") {
        REQUIRE_FALSE(loadConfig(
            withMount(
                R"({ "route": "/{p*}", "index": "a/index.html", "source": { "type": "memory", "entries": {} } })"),
            config,
            err));
        REQUIRE(err == "'index' must be a plain file name");
    }
    SECTION("unknown source type") {
        REQUIRE_FALSE(
            loadConfig(withMount(R"({ "route": "/{p*}", "source": { "type": "ftp" } })"), config, err));
        REQUIRE(err.find("unknown source type 'ftp'") != std::string::npos);
    }
    SECTION("sources missing their required keys") {
        REQUIRE_FALSE(loadConfig(
            withMount(R"({ "route": "/{p*}", "source": { "type": "folders" } })"), config, err));
        REQUIRE(err == "mount '/{p*}': folders source needs 'paths' or 'includeCurrentDir'");
        REQUIRE_FALSE(loadConfig(
            withMount(R"({ "route": "/{p*}", "source": { "type": "archive" } })"), config, err));
        REQUIRE(err == "mount '/{p*}': archive source needs 'path'");
        REQUIRE_FALSE(loadConfig(
            withMount(R"({ "route": "/{p*}", "source": { "type": "memory" } })"), config, err));
        REQUIRE(err == "mount '/{p*}': memory source needs an 'entries' object");
        REQUIRE_FALSE(loadConfig(
            withMount(R"({ "route": "/{p*}", "source": { "type": "remote" } })"), config, err));
        REQUIRE(err == "mount '/{p*}': remote source needs 'baseUrl'");
    }
    SECTION("missing file") {
        REQUIRE_FALSE(loadConfigFile("/nonexistent/datasource.json", config, err));
        REQUIRE(err == "cannot open /nonexistent/datasource.json");
    }
}

TEST_CASE("load config file", "[config]") {
    TempDir dir;
    dir.writeFile("server.json", FullConfig);
    ServerConfig config;
    std::string err;
    REQUIRE(loadConfigFile(dir.path() + "/server.json", config, err));
    REQUIRE(config.mounts_.size() == 4);

    dir.writeFile("broken.json", "{");
    REQUIRE_FALSE(loadConfigFile(dir.path() + "/broken.json", config, err));
    REQUIRE(err.find(dir.path() + "/broken.json: invalid JSON") == 0);
}

TEST_CASE("create data source", "[config]") {
    std::string err;

    SECTION("folders") {
        TempDir root;
        root.writeFile("a.txt", "A");
        SourceConfig config;
        config.kind_ = SourceKind::FileSystem;
        config.paths_ = {root.path()};

        auto source = createDataSource(config, err);
        REQUIRE(source != nullptr);
        REQUIRE(source->kind() == SourceKind::FileSystem);
        std::string out;
        REQUIRE(source->readToString("a.txt", out, err) == FetchError::None);
        REQUIRE(out == "A");
    }
    SECTION("folders with the current directory") {
        SourceConfig config;
        config.kind_ = SourceKind::FileSystem;
        config.includeCurrentDir_ = true;
        auto source = createDataSource(config, err);
        REQUIRE(source != nullptr);
        auto &backend = static_cast<const FileSystemBackend &>(source->backend());
        REQUIRE(backend.searchPaths().size() == 1);
    }
    SECTION("archive") {
        TempDir dir;
        std::vector<char> bytes = TarBuilder().addFile("x/y.txt", "why").bytes(true);
        dir.writeFile("site.tgz", std::string(bytes.begin(), bytes.end()));

        SourceConfig config;
        config.kind_ = SourceKind::Archive;
        config.archivePath_ = dir.path() + "/site.tgz";
        config.compressed_ = true;

        auto source = createDataSource(config, err);
        REQUIRE(source != nullptr);
        std::string out;
        REQUIRE(source->readToString("x/y.txt", out, err) == FetchError::None);
        REQUIRE(out == "why");
    }
    SECTION("missing archive") {
        SourceConfig config;
        config.kind_ = SourceKind::Archive;
        config.archivePath_ = "/nonexistent/site.tar";
        REQUIRE(createDataSource(config, err) == nullptr);
        REQUIRE(err == "cannot open archive /nonexistent/site.tar");
    }
    SECTION("memory") {
        SourceConfig config;
        config.kind_ = SourceKind::MemoryMap;
        config.entries_["/a/b.txt"] = "hello";

        std::vector<std::string> messages;
        auto source =
            createDataSource(config, err, [&](const std::string &msg) { messages.push_back(msg); });
        REQUIRE(source != nullptr);
        std::string out;
        REQUIRE(source->readToString("a/b.txt", out, err) == FetchError::None);
        REQUIRE(out == "hello");
        REQUIRE(!messages.empty());
    }
    SECTION("invalid memory key") {
        SourceConfig config;
        config.kind_ = SourceKind::MemoryMap;
        config.entries_["../x"] = "x";
        REQUIRE(createDataSource(config, err) == nullptr);
        REQUIRE(err == "Invalid memory map key: ../x");
    }
    SECTION("remote") {
        SourceConfig config;
        config.kind_ = SourceKind::RemoteHttp;
        config.baseUrl_ = "http://127.0.0.1:1/base/";
        auto source = createDataSource(config, err);
        REQUIRE(source != nullptr);
        REQUIRE(source->kind() == SourceKind::RemoteHttp);
        REQUIRE(source->describe() == "remote[http://127.0.0.1:1/base/]");
    }
}
