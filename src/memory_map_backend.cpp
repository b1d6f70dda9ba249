#include "datasource/memory_map_backend.hpp"

namespace datasource {

std::vector<char> toBytes(const std::string &text) {
    return std::vector<char>(text.begin(), text.end());
}

bool MemoryMapBackend::init(Entries entries, std::string &err) {
    std::map<std::string, std::shared_ptr<const std::vector<char>>> normalized;
    for (auto &entry : entries) {
        LogicalPath path;
        if (resolvePath(entry.first, path) != FetchError::None) {
            err = "Invalid memory map key: " + entry.first;
            return false;
        }
        auto buffer = std::make_shared<const std::vector<char>>(std::move(entry.second));
        if (!normalized.emplace(path.str(), buffer).second) {
            err = "Duplicate memory map key: " + entry.first;
            return false;
        }
    }
    entries_ = std::move(normalized);
    return true;
}

SourceKind MemoryMapBackend::kind() const {
    return SourceKind::MemoryMap;
}

bool MemoryMapBackend::exists(const LogicalPath &path) const {
    return entries_.find(path.str()) != entries_.end();
}

FetchResult MemoryMapBackend::fetch(const LogicalPath &path) const {
    auto it = entries_.find(path.str());
    if (it == entries_.end()) {
        return FetchResult::failure(FetchError::NotFound, "No memory entry: " + path.str());
    }
    return FetchResult::success(std::make_unique<MemoryStream>(it->second), it->first);
}

std::string MemoryMapBackend::describe() const {
    return "memory[" + std::to_string(entries_.size()) + " entries]";
}

}  // namespace datasource
