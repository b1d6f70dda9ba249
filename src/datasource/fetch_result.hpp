#pragma once

#include <memory>
#include <string>

#include "datasource/byte_stream.hpp"

namespace datasource {

// Error taxonomy shared by all backends. Backend specific failures are
// mapped to these at the DataSource boundary.
enum class FetchError { None, InvalidPath, NotFound, IoError, DecodeError, UpstreamError };

// Stable name, e.g. "NotFound".
const char *toString(FetchError error);

struct FetchResult {
    FetchError error_ = FetchError::None;

    // Human readable detail of a failure.
    std::string message_;

    // Where a hit was found: filesystem root, archive entry or remote URL.
    std::string origin_;

    // Set if and only if error_ == FetchError::None.
    std::unique_ptr<IByteStream> stream_;

    bool ok() const {
        return error_ == FetchError::None;
    }

    static FetchResult success(std::unique_ptr<IByteStream> stream, const std::string &origin);
    static FetchResult failure(FetchError error, const std::string &message);
};

}  // namespace datasource
