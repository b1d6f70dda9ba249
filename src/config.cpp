#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include "cJSON.h"
#include "datasource/config.hpp"
#include "datasource/server.hpp"

namespace datasource {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

// Optional string member. Fails if present with another type.
bool readString(const cJSON *obj, const char *key, std::string &out, std::string &err) {
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (item == nullptr) {
        return true;
    }
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = item->valuestring;
    return true;
}

bool readBool(const cJSON *obj, const char *key, bool &out, std::string &err) {
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (item == nullptr) {
        return true;
    }
    if (!cJSON_IsBool(item)) {
        err = std::string("'") + key + "' must be true or false";
        return false;
    }
    out = cJSON_IsTrue(item);
    return true;
}

// Optional non-negative integer member.
template <typename T>
bool readCount(const cJSON *obj, const char *key, T &out, std::string &err) {
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (item == nullptr) {
        return true;
    }
    // 2^digits is the first value T cannot hold, and is exact as a double
    // unlike numeric_limits<T>::max().
    const double limit = std::ldexp(1.0, std::numeric_limits<T>::digits);
    if (!cJSON_IsNumber(item) || !(item->valuedouble >= 0) || item->valuedouble >= limit ||
        item->valuedouble != std::floor(item->valuedouble)) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = static_cast<T>(item->valuedouble);
    return true;
}

// Object of "Name": "value" pairs.
bool readHeaders(const cJSON *obj, const char *key, std::vector<Header> &out, std::string &err) {
    const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (item == nullptr) {
        return true;
    }
    if (!cJSON_IsObject(item)) {
        err = std::string("'") + key + "' must be an object";
        return false;
    }

    const cJSON *header = nullptr;
    cJSON_ArrayForEach(header, item) {
        if (!cJSON_IsString(header) || header->valuestring == nullptr) {
            err = std::string("header '") + header->string + "' must be a string";
            return false;
        }
        out.push_back({header->string, header->valuestring});
    }
    return true;
}

bool parseSource(const cJSON *obj, SourceConfig &source, std::string &err) {
    if (!cJSON_IsObject(obj)) {
        err = "'source' must be an object";
        return false;
    }

    std::string type;
    if (!readString(obj, "type", type, err)) {
        return false;
    }

    if (type == "folders") {
        source.kind_ = SourceKind::FileSystem;
        const cJSON *paths = cJSON_GetObjectItemCaseSensitive(obj, "paths");
        if (paths != nullptr) {
            if (!cJSON_IsArray(paths)) {
                err = "'paths' must be an array of strings";
                return false;
            }
            const cJSON *path = nullptr;
            cJSON_ArrayForEach(path, paths) {
                if (!cJSON_IsString(path) || path->valuestring == nullptr) {
                    err = "'paths' must be an array of strings";
                    return false;
                }
                source.paths_.push_back(path->valuestring);
            }
        }
        if (!readBool(obj, "includeCurrentDir", source.includeCurrentDir_, err)) {
            return false;
        }
        if (source.paths_.empty() && !source.includeCurrentDir_) {
            err = "folders source needs 'paths' or 'includeCurrentDir'";
            return false;
        }
    } else if (type == "archive") {
        source.kind_ = SourceKind::Archive;
        if (!readString(obj, "path", source.archivePath_, err) ||
            !readBool(obj, "compressed", source.compressed_, err) ||
            !readBool(obj, "index", source.buildIndex_, err)) {
            return false;
        }
        if (source.archivePath_.empty()) {
            err = "archive source needs 'path'";
            return false;
        }
    } else if (type == "memory") {
        source.kind_ = SourceKind::MemoryMap;
        const cJSON *entries = cJSON_GetObjectItemCaseSensitive(obj, "entries");
        if (!cJSON_IsObject(entries)) {
            err = "memory source needs an 'entries' object";
            return false;
        }
        const cJSON *entry = nullptr;
        cJSON_ArrayForEach(entry, entries) {
            if (!cJSON_IsString(entry) || entry->valuestring == nullptr) {
                err = std::string("entry '") + entry->string + "' must be a string";
                return false;
            }
            source.entries_[entry->string] = entry->valuestring;
        }
    } else if (type == "remote") {
        source.kind_ = SourceKind::RemoteHttp;
        std::vector<Header> headers;
        if (!readString(obj, "baseUrl", source.baseUrl_, err) ||
            !readCount(obj, "timeout", source.remote_.timeoutSeconds_, err) ||
            !readCount(obj, "connectTimeout", source.remote_.connectTimeoutSeconds_, err) ||
            !readString(obj, "userAgent", source.remote_.userAgent_, err) ||
            !readHeaders(obj, "headers", headers, err)) {
            return false;
        }
        if (source.baseUrl_.empty()) {
            err = "remote source needs 'baseUrl'";
            return false;
        }
        for (const auto &header : headers) {
            source.remote_.headers_.push_back(header.name_ + ": " + header.value_);
        }
    } else {
        err = "unknown source type '" + type + "', expected folders, archive, memory or remote";
        return false;
    }
    return true;
}

bool parseMount(const cJSON *obj, MountConfig &mount, std::string &err) {
    if (!cJSON_IsObject(obj)) {
        err = "mount must be an object";
        return false;
    }

    if (!readString(obj, "route", mount.route_, err) ||
        !readString(obj, "index", mount.index_, err) ||
        !readCount(obj, "maxFileSize", mount.maxFileSize_, err) ||
        !readHeaders(obj, "headers", mount.headers_, err)) {
        return false;
    }
    if (mount.route_.empty()) {
        err = "mount needs a 'route'";
        return false;
    }
    if (mount.index_.empty() || mount.index_.find('/') != std::string::npos) {
        err = "'index' must be a plain file name";
        return false;
    }

    const cJSON *source = cJSON_GetObjectItemCaseSensitive(obj, "source");
    if (source == nullptr) {
        err = "mount '" + mount.route_ + "' needs a 'source'";
        return false;
    }
    if (!parseSource(source, mount.source_, err)) {
        err = "mount '" + mount.route_ + "': " + err;
        return false;
    }
    return true;
}

}  // namespace

bool loadConfig(const std::string &json, ServerConfig &config, std::string &err) {
    JsonPtr root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root) {
        const char *errorPtr = cJSON_GetErrorPtr();
        err = "invalid JSON";
        if (errorPtr != nullptr) {
            err += std::string(" near: ") + std::string(errorPtr).substr(0, 20);
        }
        return false;
    }
    if (!cJSON_IsObject(root.get())) {
        err = "configuration must be a JSON object";
        return false;
    }

    size_t port = 8080;
    const cJSON *portItem = cJSON_GetObjectItemCaseSensitive(root.get(), "port");
    if (cJSON_IsString(portItem)) {
        if (!readString(root.get(), "port", config.port_, err)) {
            return false;
        }
    } else {
        if (!readCount(root.get(), "port", port, err)) {
            return false;
        }
        if (port > 65535) {
            err = "'port' must be in 0..65535";
            return false;
        }
        config.port_ = std::to_string(port);
    }

    if (!readString(root.get(), "address", config.address_, err) ||
        !readCount(root.get(), "maxContentSize", config.maxContentSize_, err) ||
        !readCount(root.get(), "keepAliveTimeout", config.keepAliveTimeout_, err) ||
        !readCount(root.get(), "keepAliveMax", config.keepAliveMax_, err) ||
        !readCount(root.get(), "connectionLimit", config.connectionLimit_, err) ||
        !readCount(root.get(), "workerThreads", config.workerThreads_, err) ||
        !readBool(root.get(), "verbose", config.verbose_, err)) {
        return false;
    }
    if (config.maxContentSize_ < kMinContentSize) {
        err = "'maxContentSize' must be at least " + std::to_string(kMinContentSize);
        return false;
    }

    if (config.workerThreads_ < 1 || config.workerThreads_ > kMaxWorkerThreads) {
        err = "'workerThreads' must be in 1.." + std::to_string(kMaxWorkerThreads);
        return false;
    }

    const cJSON *mounts = cJSON_GetObjectItemCaseSensitive(root.get(), "mounts");
    if (!cJSON_IsArray(mounts) || cJSON_GetArraySize(mounts) == 0) {
        err = "'mounts' must be a non-empty array";
        return false;
    }

    config.mounts_.clear();
    const cJSON *mount = nullptr;
    cJSON_ArrayForEach(mount, mounts) {
        MountConfig mountConfig;
        if (!parseMount(mount, mountConfig, err)) {
            return false;
        }
        config.mounts_.push_back(std::move(mountConfig));
    }
    return true;
}

bool loadConfigFile(const std::string &path, ServerConfig &config, std::string &err) {
    std::ifstream is(path, std::ios::in | std::ios::binary);
    if (!is) {
        err = "cannot open " + path;
        return false;
    }

    std::stringstream ss;
    ss << is.rdbuf();
    if (is.bad()) {
        err = "cannot read " + path;
        return false;
    }

    if (!loadConfig(ss.str(), config, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

std::shared_ptr<const DataSource> createDataSource(const SourceConfig &config,
                                                   std::string &err,
                                                   const debugMsgCallback &debugMsgCb) {
    std::shared_ptr<DataSource> source;

    switch (config.kind_) {
        case SourceKind::FileSystem: {
            std::vector<std::string> paths = config.paths_;
            if (config.includeCurrentDir_ && !appendCurrentWorkingDir(paths, err)) {
                return nullptr;
            }
            source = std::make_shared<DataSource>(DataSource::fromFolders(std::move(paths)));
            break;
        }
        case SourceKind::Archive: {
            if (!std::ifstream(config.archivePath_, std::ios::in | std::ios::binary)) {
                err = "cannot open archive " + config.archivePath_;
                return nullptr;
            }
            ArchiveBackend::Settings settings(config.compressed_, config.buildIndex_);
            source = std::make_shared<DataSource>(
                DataSource::fromArchiveFile(config.archivePath_, settings));
            break;
        }
        case SourceKind::MemoryMap: {
            MemoryMapBackend::Entries entries;
            for (const auto &entry : config.entries_) {
                entries[entry.first] = toBytes(entry.second);
            }
            std::unique_ptr<DataSource> memory;
            if (!DataSource::fromMemoryMap(std::move(entries), memory, err)) {
                return nullptr;
            }
            source = std::move(memory);
            break;
        }
        case SourceKind::RemoteHttp:
            source = std::make_shared<DataSource>(
                DataSource::fromRemoteHttp(config.baseUrl_, config.remote_));
            break;
    }

    if (!source) {
        err = "unsupported source kind";
        return nullptr;
    }
    if (debugMsgCb) {
        source->setDebugMsgHandler(debugMsgCb);
    }
    return source;
}

}  // namespace datasource
