#include <archive.h>
#include <archive_entry.h>

#include <cerrno>
#include <limits>

#include "datasource/archive_backend.hpp"

namespace datasource {

namespace {
const size_t npos = std::numeric_limits<size_t>::max();
const size_t readBlockSize = 10240;

std::string archiveError(struct archive *a) {
    const char *msg = archive_error_string(a);
    return msg ? msg : "Unspecified error";
}

// libarchive reports container problems with its own codes (-1, EINVAL,
// EILSEQ or 0), the public header does not name them. Any other errno came
// from the system while reading the file. A container in memory has no I/O.
FetchError classifyError(struct archive *a, bool fromMemory) {
    int err = archive_errno(a);
    if (fromMemory || err == 0 || err == -1 || err == EINVAL || err == EILSEQ) {
        return FetchError::DecodeError;
    }
    return FetchError::IoError;
}

// The logical path of an entry, false when no request can reach it. A leading
// "./" or "/" is dropped, "a//b.txt" or "../x" are never served.
bool entryName(const char *pathname, std::string &name) {
    std::string raw(pathname);
    while (raw.compare(0, 2, "./") == 0) {
        raw = raw.substr(2);
    }
    if (raw.empty() || raw.back() == '/') {
        return false;
    }
    LogicalPath path;
    if (resolvePath(raw, path) != FetchError::None) {
        return false;
    }
    name = path.str();
    return true;
}

bool isFetchable(struct archive_entry *entry) {
    return archive_entry_filetype(entry) == AE_IFREG && archive_entry_pathname(entry) != nullptr;
}

// Stream over the data of the entry the reader is positioned on. Keeps the
// container bytes alive when reading from memory.
class ArchiveEntryStream : public IByteStream {
   public:
    ArchiveEntryStream(ArchiveBackend::ArchivePtr reader,
                       std::shared_ptr<const std::vector<char>> data,
                       size_t entrySize)
        : reader_(std::move(reader)), data_(std::move(data)), entrySize_(entrySize) {}
    virtual ~ArchiveEntryStream() = default;

    int read(char *buf, size_t maxSize) override {
        la_ssize_t nrReadBytes = archive_read_data(reader_.get(), buf, maxSize);
        if (nrReadBytes < 0) {
            err_ = archiveError(reader_.get());
            return -1;
        }
        return static_cast<int>(nrReadBytes);
    }

    size_t size() const override {
        return entrySize_;
    }

    std::string errorMessage() const override {
        return err_;
    }

   private:
    ArchiveBackend::ArchivePtr reader_;
    std::shared_ptr<const std::vector<char>> data_;
    const size_t entrySize_;
    std::string err_;
};
}  // namespace

void ArchiveBackend::ArchiveDeleter::operator()(struct archive *a) const {
    archive_read_free(a);
}

ArchiveBackend::ArchiveBackend(const std::string &archivePath, Settings settings)
    : archivePath_(archivePath), settings_(settings) {}

ArchiveBackend::ArchiveBackend(std::vector<char> archiveData, Settings settings)
    : archiveData_(std::make_shared<const std::vector<char>>(std::move(archiveData))),
      settings_(settings) {}

SourceKind ArchiveBackend::kind() const {
    return SourceKind::Archive;
}

FetchError ArchiveBackend::openReader(ArchivePtr &reader, std::string &err) const {
    ArchivePtr a(archive_read_new());
    if (!a) {
        err = "Could not allocate archive reader";
        return FetchError::IoError;
    }

    int r = settings_.compressed_ ? archive_read_support_filter_all(a.get())
                                  : archive_read_support_filter_none(a.get());
    if (r == ARCHIVE_OK) {
        r = archive_read_support_format_tar(a.get());
    }
    if (r == ARCHIVE_OK) {
        r = archive_read_support_format_empty(a.get());
    }
    if (r != ARCHIVE_OK) {
        err = archiveError(a.get());
        return FetchError::DecodeError;
    }

    if (archiveData_) {
        r = archive_read_open_memory(a.get(), archiveData_->data(), archiveData_->size());
    } else {
        r = archive_read_open_filename(a.get(), archivePath_.c_str(), readBlockSize);
    }
    if (r != ARCHIVE_OK) {
        err = "Could not open archive: " + archiveError(a.get());
        return classifyError(a.get(), archiveData_ != nullptr);
    }

    reader = std::move(a);
    return FetchError::None;
}

void ArchiveBackend::scanEntries(Index &index) const {
    ArchivePtr reader;
    index.error_ = openReader(reader, index.message_);
    if (index.error_ != FetchError::None) {
        return;
    }

    struct archive_entry *entry = nullptr;
    for (size_t ordinal = 0;; ++ordinal) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            return;
        }
        if (r < ARCHIVE_WARN) {
            index.error_ = classifyError(reader.get(), archiveData_ != nullptr);
            index.message_ = "Corrupt archive: " + archiveError(reader.get());
            return;
        }
        std::string name;
        if (!isFetchable(entry) || !entryName(archive_entry_pathname(entry), name)) {
            continue;
        }
        size_t entrySize = archive_entry_size_is_set(entry)
                               ? static_cast<size_t>(archive_entry_size(entry))
                               : IByteStream::unknownSize;
        if (index.entries_.emplace(name, IndexEntry{ordinal, entrySize}).second) {
            index.names_.push_back(name);
        }
    }
}

const ArchiveBackend::Index &ArchiveBackend::index() const {
    if (!indexBuilt_.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(indexMutex_);
        if (!indexBuilt_.load(std::memory_order_relaxed)) {
            auto built = std::make_unique<Index>();
            scanEntries(*built);
            index_ = std::move(built);
            indexBuildCount_++;
            indexBuilt_.store(true, std::memory_order_release);
        }
    }
    return *index_;
}

FetchResult ArchiveBackend::openEntry(const std::string &name, size_t ordinal) const {
    ArchivePtr reader;
    std::string err;
    FetchError error = openReader(reader, err);
    if (error != FetchError::None) {
        return FetchResult::failure(error, err);
    }

    struct archive_entry *entry = nullptr;
    for (size_t current = 0;; ++current) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return FetchResult::failure(classifyError(reader.get(), archiveData_ != nullptr),
                                        "Corrupt archive: " + archiveError(reader.get()));
        }
        if (ordinal != npos && current < ordinal) {
            continue;
        }
        std::string entryPath;
        if (isFetchable(entry) && entryName(archive_entry_pathname(entry), entryPath) &&
            entryPath == name) {
            size_t entrySize = archive_entry_size_is_set(entry)
                                   ? static_cast<size_t>(archive_entry_size(entry))
                                   : IByteStream::unknownSize;
            return FetchResult::success(
                std::make_unique<ArchiveEntryStream>(std::move(reader), archiveData_, entrySize),
                name);
        }
        if (ordinal != npos) {
            // the container changed underneath the index
            break;
        }
    }

    return FetchResult::failure(FetchError::NotFound, "Can't find the file in archive: " + name);
}

bool ArchiveBackend::exists(const LogicalPath &path) const {
    if (settings_.buildIndex_) {
        const Index &idx = index();
        return idx.entries_.find(path.str()) != idx.entries_.end();
    }

    std::vector<std::string> names;
    std::string err;
    if (listEntries(names, err) != FetchError::None) {
        return false;
    }
    for (const auto &name : names) {
        if (name == path.str()) {
            return true;
        }
    }
    return false;
}

FetchResult ArchiveBackend::fetch(const LogicalPath &path) const {
    const std::string name = path.str();
    if (!settings_.buildIndex_) {
        return openEntry(name, npos);
    }

    const Index &idx = index();
    if (idx.error_ != FetchError::None) {
        return FetchResult::failure(idx.error_, idx.message_);
    }
    auto it = idx.entries_.find(name);
    if (it == idx.entries_.end()) {
        return FetchResult::failure(FetchError::NotFound,
                                    "Can't find the file in archive: " + name);
    }
    return openEntry(name, it->second.ordinal_);
}

FetchError ArchiveBackend::listEntries(std::vector<std::string> &names, std::string &err) const {
    if (settings_.buildIndex_) {
        const Index &idx = index();
        err = idx.message_;
        names = idx.names_;
        return idx.error_;
    }

    Index scanned;
    scanEntries(scanned);
    err = scanned.message_;
    names = std::move(scanned.names_);
    return scanned.error_;
}

std::string ArchiveBackend::describe() const {
    std::string desc = archiveData_ ? "archive[" + std::to_string(archiveData_->size()) + " bytes"
                                    : "archive[" + archivePath_;
    if (settings_.compressed_) {
        desc += ", compressed";
    }
    return desc + "]";
}

}  // namespace datasource
