#include <filesystem>
#include <system_error>

#include "datasource/file_system_backend.hpp"

namespace fs = std::filesystem;

namespace datasource {

namespace {
fs::path toFsPath(const std::string &root, const LogicalPath &path) {
    fs::path fullPath(root);
    for (const auto &segment : path.segments()) {
        fullPath /= segment;
    }
    return fullPath;
}
}  // namespace

FileSystemBackend::FileSystemBackend(std::vector<std::string> searchPaths)
    : searchPaths_(std::move(searchPaths)) {}

SourceKind FileSystemBackend::kind() const {
    return SourceKind::FileSystem;
}

bool FileSystemBackend::exists(const LogicalPath &path) const {
    for (const auto &root : searchPaths_) {
        std::error_code ec;
        if (fs::is_regular_file(toFsPath(root, path), ec)) {
            return true;
        }
    }
    return false;
}

FetchResult FileSystemBackend::fetch(const LogicalPath &path) const {
    for (const auto &root : searchPaths_) {
        fs::path fullPath = toFsPath(root, path);

        std::error_code ec;
        fs::file_status status = fs::status(fullPath, ec);
        if (ec || !fs::is_regular_file(status)) {
            // absent in this root (a directory does not count as a hit)
            continue;
        }

        size_t fileSize = fs::file_size(fullPath, ec);
        if (ec) {
            return FetchResult::failure(FetchError::IoError,
                                        "Could not stat " + fullPath.string() + ": " +
                                            ec.message());
        }

        std::ifstream is(fullPath, std::ios::in | std::ios::binary);
        if (!is.is_open()) {
            return FetchResult::failure(FetchError::IoError,
                                        "Could not open file: " + fullPath.string());
        }
        return FetchResult::success(std::make_unique<FileStream>(std::move(is), fileSize), root);
    }

    return FetchResult::failure(FetchError::NotFound,
                                "File not found in specified directories: " + path.str());
}

std::string FileSystemBackend::describe() const {
    std::string desc = "folders[";
    for (size_t i = 0; i < searchPaths_.size(); ++i) {
        if (i > 0) {
            desc += ", ";
        }
        desc += searchPaths_[i];
    }
    return desc + "]";
}

bool appendCurrentWorkingDir(std::vector<std::string> &searchPaths, std::string &err) {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        err = "Could not determine current directory: " + ec.message();
        return false;
    }
    searchPaths.push_back(cwd.string());
    return true;
}

}  // namespace datasource
