#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "datasource/i_source_backend.hpp"

struct archive;

namespace datasource {

// Serves the regular file entries of a tar container, read from a file or
// from an owned byte buffer, optionally compressed. Entry names are matched
// against LogicalPath::str() after dropping a leading "./". When a name occurs
// more than once the first entry wins.
class ArchiveBackend : public ISourceBackend {
   public:
    struct Settings {
        Settings(bool compressed = false, bool buildIndex = true)
            : compressed_(compressed), buildIndex_(buildIndex) {}

        // Accept compressed containers (gzip, bzip2, xz, zstd, ...). When false
        // only a plain tar stream is recognized.
        bool compressed_;

        // Build a name index on first access. Without it every lookup is a
        // linear scan of the container.
        bool buildIndex_;
    };

    ArchiveBackend(const std::string &archivePath, Settings settings);
    ArchiveBackend(std::vector<char> archiveData, Settings settings);
    virtual ~ArchiveBackend() = default;

    SourceKind kind() const override;
    bool exists(const LogicalPath &path) const override;
    FetchResult fetch(const LogicalPath &path) const override;
    std::string describe() const override;

    // Names of all fetchable entries in container order. Returns
    // FetchError::DecodeError or FetchError::IoError if the container cannot
    // be listed.
    FetchError listEntries(std::vector<std::string> &names, std::string &err) const;

    bool isIndexBuilt() const {
        return indexBuilt_.load(std::memory_order_acquire);
    }

#ifdef DATASOURCE_ENABLE_TESTING
    size_t getIndexBuildCount() const {
        return indexBuildCount_;
    }
#endif

    struct ArchiveDeleter {
        void operator()(struct archive *a) const;
    };
    using ArchivePtr = std::unique_ptr<struct archive, ArchiveDeleter>;

   private:
    struct IndexEntry {
        size_t ordinal_;
        size_t size_;
    };

    struct Index {
        FetchError error_ = FetchError::None;
        std::string message_;
        std::unordered_map<std::string, IndexEntry> entries_;
        std::vector<std::string> names_;
    };

    // Open a fresh reader positioned before the first entry.
    FetchError openReader(ArchivePtr &reader, std::string &err) const;

    // Walk all headers and collect the fetchable entries.
    void scanEntries(Index &index) const;

    // Lazily built index, see buildIndex_.
    const Index &index() const;

    // Position a fresh reader on the entry with the given name (or ordinal
    // when ordinal != npos) and hand it out as a stream.
    FetchResult openEntry(const std::string &name, size_t ordinal) const;

    const std::string archivePath_;
    const std::shared_ptr<const std::vector<char>> archiveData_;
    const Settings settings_;

    // Guards the one-time build of index_. Once indexBuilt_ is set, index_ is
    // immutable and read without locking.
    mutable std::mutex indexMutex_;
    mutable std::atomic<bool> indexBuilt_{false};
    mutable std::unique_ptr<const Index> index_;
    mutable size_t indexBuildCount_ = 0;
};

}  // namespace datasource
