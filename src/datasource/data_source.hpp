#pragma once

#include <memory>
#include <string>
#include <vector>

#include "datasource/archive_backend.hpp"
#include "datasource/datasource_common.hpp"
#include "datasource/file_system_backend.hpp"
#include "datasource/i_source_backend.hpp"
#include "datasource/memory_map_backend.hpp"
#include "datasource/remote_http_backend.hpp"

namespace datasource {

// Where to get the content of a requested file. Exactly one backend is
// active; lookups never leave the scope the backend was configured with.
//
// A DataSource is read-only after construction and may be shared between
// any number of concurrent callers.
class DataSource {
   public:
    explicit DataSource(std::unique_ptr<ISourceBackend> backend);
    ~DataSource() = default;

    DataSource(DataSource &&) = default;
    DataSource &operator=(DataSource &&) = default;

    static DataSource fromFolders(std::vector<std::string> searchPaths);
    static DataSource fromArchiveFile(const std::string &archivePath,
                                      ArchiveBackend::Settings settings = {});
    static DataSource fromArchiveBytes(std::vector<char> archiveData,
                                       ArchiveBackend::Settings settings = {});
    static DataSource fromRemoteHttp(const std::string &baseUrl,
                                     RemoteHttpBackend::Settings settings = {});

    // Fails if a key is not a valid logical path.
    static bool fromMemoryMap(MemoryMapBackend::Entries entries,
                              std::unique_ptr<DataSource> &source,
                              std::string &err);

    SourceKind kind() const;
    std::string describe() const;

    bool exists(const LogicalPath &path) const;
    FetchResult fetch(const LogicalPath &path) const;

    // Resolve 'rawPath' first, FetchError::InvalidPath if that fails.
    bool exists(const std::string &rawPath) const;
    FetchResult fetch(const std::string &rawPath) const;

    // Fetch and drain into 'out'. Returns FetchError::None on success,
    // otherwise the error kind with details in 'err'.
    FetchError readToString(const std::string &rawPath, std::string &out, std::string &err) const;

    const ISourceBackend &backend() const {
        return *backend_;
    }

    void setDebugMsgHandler(const debugMsgCallback &cb);

   private:
    std::unique_ptr<ISourceBackend> backend_;

    // Callback to handle debug messages.
    debugMsgCallback debugMsgCb_;
};

}  // namespace datasource
