#pragma once

#include <string>

#include "datasource/fetch_result.hpp"
#include "datasource/logical_path.hpp"

namespace datasource {

enum class SourceKind { FileSystem, Archive, MemoryMap, RemoteHttp };

const char *toString(SourceKind kind);

// One storage strategy behind a DataSource. Implementations are read-only
// after construction and must tolerate concurrent exists()/fetch() calls.
class ISourceBackend {
   public:
    ISourceBackend() = default;
    virtual ~ISourceBackend() = default;

    ISourceBackend(const ISourceBackend &) = delete;
    ISourceBackend &operator=(const ISourceBackend &) = delete;

    virtual SourceKind kind() const = 0;

    // Presence check that avoids producing the bytes where possible.
    virtual bool exists(const LogicalPath &path) const = 0;

    virtual FetchResult fetch(const LogicalPath &path) const = 0;

    // Short description for log messages, e.g. "folders[./www, /srv]".
    virtual std::string describe() const = 0;
};

}  // namespace datasource
