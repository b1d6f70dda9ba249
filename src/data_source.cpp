#include "datasource/data_source.hpp"

namespace {
void defaultDebugMsgHandler(const std::string &) {}
}

namespace datasource {

const char *toString(SourceKind kind) {
    switch (kind) {
        case SourceKind::FileSystem:
            return "FileSystem";
        case SourceKind::Archive:
            return "Archive";
        case SourceKind::MemoryMap:
            return "MemoryMap";
        case SourceKind::RemoteHttp:
            return "RemoteHttp";
        default:
            return "Unknown";
    }
}

DataSource::DataSource(std::unique_ptr<ISourceBackend> backend)
    : backend_(std::move(backend)), debugMsgCb_(defaultDebugMsgHandler) {}

DataSource DataSource::fromFolders(std::vector<std::string> searchPaths) {
    return DataSource(std::make_unique<FileSystemBackend>(std::move(searchPaths)));
}

DataSource DataSource::fromArchiveFile(const std::string &archivePath,
                                       ArchiveBackend::Settings settings) {
    return DataSource(std::make_unique<ArchiveBackend>(archivePath, settings));
}

DataSource DataSource::fromArchiveBytes(std::vector<char> archiveData,
                                        ArchiveBackend::Settings settings) {
    return DataSource(std::make_unique<ArchiveBackend>(std::move(archiveData), settings));
}

DataSource DataSource::fromRemoteHttp(const std::string &baseUrl,
                                      RemoteHttpBackend::Settings settings) {
    return DataSource(std::make_unique<RemoteHttpBackend>(baseUrl, std::move(settings)));
}

bool DataSource::fromMemoryMap(MemoryMapBackend::Entries entries,
                               std::unique_ptr<DataSource> &source,
                               std::string &err) {
    auto backend = std::make_unique<MemoryMapBackend>();
    if (!backend->init(std::move(entries), err)) {
        return false;
    }
    source = std::make_unique<DataSource>(std::move(backend));
    return true;
}

SourceKind DataSource::kind() const {
    return backend_->kind();
}

std::string DataSource::describe() const {
    return backend_->describe();
}

bool DataSource::exists(const LogicalPath &path) const {
    return backend_->exists(path);
}

FetchResult DataSource::fetch(const LogicalPath &path) const {
    FetchResult result = backend_->fetch(path);
    if (result.ok()) {
        debugMsgCb_("fetch " + path.str() + " from " + describe() + ": found in " +
                    result.origin_);
    } else {
        debugMsgCb_("fetch " + path.str() + " from " + describe() + ": " +
                    toString(result.error_) + ": " + result.message_);
    }
    return result;
}

bool DataSource::exists(const std::string &rawPath) const {
    LogicalPath path;
    if (resolvePath(rawPath, path) != FetchError::None) {
        return false;
    }
    return exists(path);
}

FetchResult DataSource::fetch(const std::string &rawPath) const {
    LogicalPath path;
    if (resolvePath(rawPath, path) != FetchError::None) {
        debugMsgCb_("fetch " + rawPath + ": rejected invalid path");
        return FetchResult::failure(FetchError::InvalidPath, "Invalid path: " + rawPath);
    }
    return fetch(path);
}

FetchError DataSource::readToString(const std::string &rawPath,
                                    std::string &out,
                                    std::string &err) const {
    FetchResult result = fetch(rawPath);
    if (!result.ok()) {
        err = result.message_;
        return result.error_;
    }

    std::vector<char> bytes;
    if (!readAll(*result.stream_, bytes, err)) {
        return kind() == SourceKind::Archive ? FetchError::DecodeError : FetchError::IoError;
    }
    out.assign(bytes.begin(), bytes.end());
    return FetchError::None;
}

void DataSource::setDebugMsgHandler(const debugMsgCallback &cb) {
    debugMsgCb_ = cb;
}

}  // namespace datasource
