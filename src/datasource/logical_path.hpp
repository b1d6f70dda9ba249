#pragma once

#include <string>
#include <vector>

#include "datasource/fetch_result.hpp"

namespace datasource {

const char kDefaultIndexFile[] = "index.html";

// A normalized, traversal-safe path used as lookup key in every backend.
// Segments are never empty, "." or "..". The canonical string form has no
// leading slash.
class LogicalPath {
   public:
    LogicalPath() = default;

    const std::vector<std::string> &segments() const {
        return segments_;
    }

    bool empty() const {
        return segments_.empty();
    }

    // Segments joined with '/'.
    std::string str() const;

    // Lower-cased text after the last dot of the last segment, or empty.
    std::string extension() const;

    bool operator==(const LogicalPath &other) const {
        return segments_ == other.segments_;
    }
    bool operator!=(const LogicalPath &other) const {
        return segments_ != other.segments_;
    }
    bool operator<(const LogicalPath &other) const {
        return segments_ < other.segments_;
    }

   private:
    friend class PathResolver;

    std::vector<std::string> segments_;
};

// Turns raw request paths into LogicalPaths. The index document used for
// empty and directory paths is fixed for the lifetime of the resolver.
class PathResolver {
   public:
    explicit PathResolver(const std::string &indexFile = kDefaultIndexFile);

    // Returns FetchError::None and fills 'path' on success, otherwise
    // FetchError::InvalidPath and leaves 'path' untouched.
    FetchError resolve(const std::string &raw, LogicalPath &path) const;

    const std::string &indexFile() const {
        return indexFile_;
    }

   private:
    const std::string indexFile_;
};

// Resolve with the default index document.
FetchError resolvePath(const std::string &raw, LogicalPath &path);

}  // namespace datasource
