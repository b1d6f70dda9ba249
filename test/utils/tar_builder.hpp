#pragma once

#include <string>
#include <utility>
#include <vector>

namespace datasource {

// Builds tar containers in memory for archive tests.
class TarBuilder {
   public:
    // Regular file entry.
    TarBuilder &addFile(const std::string &name, const std::string &content);

    // Directory entry, never fetchable.
    TarBuilder &addDirectory(const std::string &name);

    // Symbolic link entry, never fetchable.
    TarBuilder &addSymlink(const std::string &name, const std::string &target);

    // Write the container, gzip compressed if 'gzip' is set. Returns false and
    // sets 'err' if libarchive fails.
    bool build(bool gzip, std::vector<char> &out, std::string &err) const;

    // build() for tests that do not expect failure, empty on error.
    std::vector<char> bytes(bool gzip = false) const;

   private:
    enum class EntryType { File, Directory, Symlink };

    struct Entry {
        EntryType type_;
        std::string name_;
        std::string content_;
    };

    std::vector<Entry> entries_;
};

}  // namespace datasource
