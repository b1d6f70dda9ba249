#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "datasource/i_source_backend.hpp"

namespace datasource {

// Exact key lookup in a table of path -> bytes. The backend owns all buffers;
// streams handed out share them, so they stay valid on their own.
class MemoryMapBackend : public ISourceBackend {
   public:
    using Entries = std::map<std::string, std::vector<char>>;

    MemoryMapBackend() = default;
    virtual ~MemoryMapBackend() = default;

    // Keys go through PathResolution. Returns false and sets 'err' if a key is
    // not a valid logical path or two keys normalize to the same path.
    bool init(Entries entries, std::string &err);

    SourceKind kind() const override;
    bool exists(const LogicalPath &path) const override;
    FetchResult fetch(const LogicalPath &path) const override;
    std::string describe() const override;

    size_t size() const {
        return entries_.size();
    }

   private:
    std::map<std::string, std::shared_ptr<const std::vector<char>>> entries_;
};

// Convenience for building Entries from text literals.
std::vector<char> toBytes(const std::string &text);

}  // namespace datasource
