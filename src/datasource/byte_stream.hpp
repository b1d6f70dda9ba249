#pragma once

#include <cstddef>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace datasource {

// Incremental producer of the bytes of one fetched file.
class IByteStream {
   public:
    static constexpr size_t unknownSize = std::numeric_limits<size_t>::max();

    IByteStream() = default;
    virtual ~IByteStream() = default;

    // Read up to maxSize bytes into buf. Returns the number of bytes read,
    // 0 at end of stream and -1 on failure (see errorMessage()).
    virtual int read(char *buf, size_t maxSize) = 0;

    // Total number of bytes the stream yields, or unknownSize.
    virtual size_t size() const = 0;

    // Discard up to n bytes. Returns the number of bytes actually skipped.
    virtual size_t skip(size_t n);

    virtual std::string errorMessage() const {
        return "";
    }
};

// Stream over a shared, immutable buffer.
class MemoryStream : public IByteStream {
   public:
    explicit MemoryStream(std::shared_ptr<const std::vector<char>> data);
    virtual ~MemoryStream() = default;

    int read(char *buf, size_t maxSize) override;
    size_t size() const override;
    size_t skip(size_t n) override;

   private:
    std::shared_ptr<const std::vector<char>> data_;
    size_t pos_ = 0;
};

// Stream over a file opened for binary reading.
class FileStream : public IByteStream {
   public:
    FileStream(std::ifstream is, size_t fileSize);
    virtual ~FileStream() = default;

    int read(char *buf, size_t maxSize) override;
    size_t size() const override;
    size_t skip(size_t n) override;
    std::string errorMessage() const override;

   private:
    std::ifstream is_;
    const size_t fileSize_;
    size_t pos_ = 0;
    std::string err_;
};

// Drain 'stream' into 'out'. Fails when the stream reports an error or yields
// a different number of bytes than its announced size.
bool readAll(IByteStream &stream, std::vector<char> &out, std::string &err);

}  // namespace datasource
