#include <algorithm>
#include <cstring>

#include "datasource/logical_path.hpp"
#include "mock_source_backend.hpp"

namespace datasource {

namespace {

// Memory stream with optional unknown size and optional failure point.
class ScriptedStream : public IByteStream {
   public:
    ScriptedStream(std::string content, bool reportSize, bool failing, size_t failAfter)
        : content_(std::move(content)),
          reportSize_(reportSize),
          failing_(failing),
          failAfter_(failAfter) {}

    int read(char *buf, size_t maxSize) override {
        size_t end = failing_ ? std::min(failAfter_, content_.size()) : content_.size();
        if (pos_ >= end) {
            return failing_ ? -1 : 0;
        }
        size_t n = std::min(maxSize, end - pos_);
        std::memcpy(buf, content_.data() + pos_, n);
        pos_ += n;
        return static_cast<int>(n);
    }

    size_t size() const override {
        return reportSize_ ? content_.size() : unknownSize;
    }

    std::string errorMessage() const override {
        return failing_ ? "scripted read failure" : "";
    }

   private:
    const std::string content_;
    const bool reportSize_;
    const bool failing_;
    const size_t failAfter_;
    size_t pos_ = 0;
};

}  // namespace

void MockSourceBackend::setContent(const std::string &path,
                                   const std::string &content,
                                   bool reportSize) {
    Outcome outcome;
    outcome.content_ = content;
    outcome.reportSize_ = reportSize;
    outcomes_[path] = outcome;
}

void MockSourceBackend::setFailingContent(const std::string &path,
                                          const std::string &content,
                                          size_t goodBytes) {
    Outcome outcome;
    outcome.content_ = content;
    outcome.failing_ = true;
    outcome.failAfter_ = goodBytes;
    outcomes_[path] = outcome;
}

void MockSourceBackend::setError(const std::string &path,
                                 FetchError error,
                                 const std::string &message) {
    Outcome outcome;
    outcome.error_ = error;
    outcome.message_ = message;
    outcomes_[path] = outcome;
}

SourceKind MockSourceBackend::kind() const {
    return SourceKind::MemoryMap;
}

bool MockSourceBackend::exists(const LogicalPath &path) const {
    auto it = outcomes_.find(path.str());
    return it != outcomes_.end() && it->second.error_ == FetchError::None;
}

FetchResult MockSourceBackend::fetch(const LogicalPath &path) const {
    noFetchCalls_++;
    fetchedPaths_.push_back(path.str());

    auto it = outcomes_.find(path.str());
    if (it == outcomes_.end()) {
        return FetchResult::failure(FetchError::NotFound, "not scripted: " + path.str());
    }

    const Outcome &outcome = it->second;
    if (outcome.error_ != FetchError::None) {
        return FetchResult::failure(outcome.error_, outcome.message_);
    }
    return FetchResult::success(
        std::make_unique<ScriptedStream>(
            outcome.content_, outcome.reportSize_, outcome.failing_, outcome.failAfter_),
        "mock:" + path.str());
}

std::string MockSourceBackend::describe() const {
    return "mock[" + std::to_string(outcomes_.size()) + " entries]";
}

}  // namespace datasource
