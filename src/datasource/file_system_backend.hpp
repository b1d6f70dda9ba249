#pragma once

#include <string>
#include <vector>

#include "datasource/i_source_backend.hpp"

namespace datasource {

// Looks files up in an ordered list of directory roots, first match wins.
class FileSystemBackend : public ISourceBackend {
   public:
    explicit FileSystemBackend(std::vector<std::string> searchPaths);
    virtual ~FileSystemBackend() = default;

    SourceKind kind() const override;
    bool exists(const LogicalPath &path) const override;
    FetchResult fetch(const LogicalPath &path) const override;
    std::string describe() const override;

    const std::vector<std::string> &searchPaths() const {
        return searchPaths_;
    }

   private:
    const std::vector<std::string> searchPaths_;
};

// Append the process' current working directory to 'searchPaths'. Returns
// false and sets 'err' if it cannot be determined.
bool appendCurrentWorkingDir(std::vector<std::string> &searchPaths, std::string &err);

}  // namespace datasource
