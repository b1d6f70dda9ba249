#include <algorithm>
#include <cstring>

#include "datasource/byte_stream.hpp"
#include "datasource/fetch_result.hpp"

namespace datasource {

const char *toString(FetchError error) {
    switch (error) {
        case FetchError::None:
            return "None";
        case FetchError::InvalidPath:
            return "InvalidPath";
        case FetchError::NotFound:
            return "NotFound";
        case FetchError::IoError:
            return "IoError";
        case FetchError::DecodeError:
            return "DecodeError";
        case FetchError::UpstreamError:
            return "UpstreamError";
        default:
            return "Unknown";
    }
}

FetchResult FetchResult::success(std::unique_ptr<IByteStream> stream, const std::string &origin) {
    FetchResult result;
    result.origin_ = origin;
    result.stream_ = std::move(stream);
    return result;
}

FetchResult FetchResult::failure(FetchError error, const std::string &message) {
    FetchResult result;
    result.error_ = error;
    result.message_ = message;
    return result;
}

size_t IByteStream::skip(size_t n) {
    char buf[4096];
    size_t skipped = 0;
    while (skipped < n) {
        int nrReadBytes = read(buf, std::min(sizeof(buf), n - skipped));
        if (nrReadBytes <= 0) {
            break;
        }
        skipped += nrReadBytes;
    }
    return skipped;
}

MemoryStream::MemoryStream(std::shared_ptr<const std::vector<char>> data)
    : data_(std::move(data)) {}

int MemoryStream::read(char *buf, size_t maxSize) {
    size_t leftBytes = data_->size() - pos_;
    size_t bytesToCopy = std::min(maxSize, leftBytes);
    if (bytesToCopy > 0) {
        std::memcpy(buf, data_->data() + pos_, bytesToCopy);
        pos_ += bytesToCopy;
    }
    return static_cast<int>(bytesToCopy);
}

size_t MemoryStream::size() const {
    return data_->size();
}

size_t MemoryStream::skip(size_t n) {
    size_t skipped = std::min(n, data_->size() - pos_);
    pos_ += skipped;
    return skipped;
}

FileStream::FileStream(std::ifstream is, size_t fileSize)
    : is_(std::move(is)), fileSize_(fileSize) {}

int FileStream::read(char *buf, size_t maxSize) {
    if (pos_ >= fileSize_) {
        return 0;
    }
    // never hand out more than announced, the file may grow while serving
    is_.read(buf, std::min(maxSize, fileSize_ - pos_));
    std::streamsize nrReadBytes = is_.gcount();
    if (nrReadBytes <= 0) {
        err_ = "file ended after " + std::to_string(pos_) + " of " + std::to_string(fileSize_) +
               " bytes";
        return -1;
    }
    pos_ += nrReadBytes;
    return static_cast<int>(nrReadBytes);
}

size_t FileStream::size() const {
    return fileSize_;
}

size_t FileStream::skip(size_t n) {
    size_t skipped = std::min(n, fileSize_ - pos_);
    is_.seekg(static_cast<std::streamoff>(pos_ + skipped), std::ios::beg);
    if (!is_) {
        // seek failed, fall back to reading
        is_.clear();
        is_.seekg(static_cast<std::streamoff>(pos_), std::ios::beg);
        return IByteStream::skip(n);
    }
    pos_ += skipped;
    return skipped;
}

std::string FileStream::errorMessage() const {
    return err_;
}

bool readAll(IByteStream &stream, std::vector<char> &out, std::string &err) {
    out.clear();
    if (stream.size() != IByteStream::unknownSize) {
        out.reserve(stream.size());
    }

    char buf[8192];
    while (true) {
        int nrReadBytes = stream.read(buf, sizeof(buf));
        if (nrReadBytes < 0) {
            err = stream.errorMessage();
            return false;
        }
        if (nrReadBytes == 0) {
            break;
        }
        out.insert(out.end(), buf, buf + nrReadBytes);
    }

    if (stream.size() != IByteStream::unknownSize && out.size() != stream.size()) {
        err = "expected " + std::to_string(stream.size()) + " bytes, got " +
              std::to_string(out.size());
        return false;
    }
    return true;
}

}  // namespace datasource
