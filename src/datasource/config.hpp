#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "datasource/data_source.hpp"
#include "datasource/datasource_common.hpp"
#include "datasource/header.hpp"
#include "datasource/logical_path.hpp"

namespace datasource {

// Construction inputs of one DataSource, the "source" object of a mount.
struct SourceConfig {
    SourceKind kind_ = SourceKind::FileSystem;

    // FileSystem: "paths", "includeCurrentDir"
    std::vector<std::string> paths_;
    bool includeCurrentDir_ = false;

    // Archive: "path", "compressed", "index"
    std::string archivePath_;
    bool compressed_ = false;
    bool buildIndex_ = true;

    // MemoryMap: "entries", logical path -> text content
    std::map<std::string, std::string> entries_;

    // RemoteHttp: "baseUrl", "timeout", "connectTimeout", "userAgent", "headers"
    std::string baseUrl_;
    RemoteHttpBackend::Settings remote_;
};

// One FileServer bound to a route.
struct MountConfig {
    // Route pattern ending in a catch-all, e.g. "/static/{path*}".
    std::string route_;
    std::string index_ = kDefaultIndexFile;
    size_t maxFileSize_ = 0;
    std::vector<Header> headers_;
    SourceConfig source_;
};

struct ServerConfig {
    std::string address_ = "0.0.0.0";
    std::string port_ = "8080";
    size_t maxContentSize_ = 8192;
    size_t keepAliveTimeout_ = 5;
    size_t keepAliveMax_ = 100;
    size_t connectionLimit_ = 0;
    size_t workerThreads_ = kDefaultWorkerThreads;
    bool verbose_ = false;
    std::vector<MountConfig> mounts_;
};

// Parse a JSON configuration document. On failure 'err' names the offending
// key and 'config' is unspecified.
bool loadConfig(const std::string &json, ServerConfig &config, std::string &err);

bool loadConfigFile(const std::string &path, ServerConfig &config, std::string &err);

// Build the DataSource described by 'config'. Returns nullptr and sets 'err'
// on failure. 'debugMsgCb' is installed before the source is shared.
std::shared_ptr<const DataSource> createDataSource(const SourceConfig &config,
                                                   std::string &err,
                                                   const debugMsgCallback &debugMsgCb = nullptr);

}  // namespace datasource
