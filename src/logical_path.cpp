#include <algorithm>
#include <cctype>

#include "datasource/logical_path.hpp"

namespace datasource {

std::string LogicalPath::str() const {
    std::string joined;
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) {
            joined += '/';
        }
        joined += segments_[i];
    }
    return joined;
}

std::string LogicalPath::extension() const {
    if (segments_.empty()) {
        return "";
    }
    const std::string &last = segments_.back();
    std::size_t lastDotPos = last.find_last_of('.');
    if (lastDotPos == std::string::npos || lastDotPos == 0) {
        // no dot, or a dot file such as ".profile"
        return "";
    }
    std::string ext = last.substr(lastDotPos + 1);
    std::transform(
        ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

PathResolver::PathResolver(const std::string &indexFile) : indexFile_(indexFile) {}

FetchError PathResolver::resolve(const std::string &raw, LogicalPath &path) const {
    if (raw.find('\\') != std::string::npos || raw.find('\0') != std::string::npos) {
        return FetchError::InvalidPath;
    }

    std::string rest = raw;
    if (!rest.empty() && rest[0] == '/') {
        rest = rest.substr(1);
    }

    // empty path or a directory: ask for the index document
    if (rest.empty() || rest.back() == '/') {
        rest += indexFile_;
    }

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        std::size_t end = rest.find('/', start);
        std::string segment =
            rest.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return FetchError::InvalidPath;
        }
        segments.push_back(segment);
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    path.segments_ = std::move(segments);
    return FetchError::None;
}

FetchError resolvePath(const std::string &raw, LogicalPath &path) {
    static const PathResolver defaultResolver;
    return defaultResolver.resolve(raw, path);
}

}  // namespace datasource
